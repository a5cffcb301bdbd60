#pragma once

// Single source of truth for the Qalla server version.
// Reported by the health probe and the startup banner.
#define QALLA_VERSION_MAJOR  1
#define QALLA_VERSION_MINOR  0
#define QALLA_VERSION_PATCH  0
#define QALLA_VERSION_STRING "1.0.0"
