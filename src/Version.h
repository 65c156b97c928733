#pragma once

// Overridden by the build with the project version.
#ifndef MESHIRC_VERSION
#define MESHIRC_VERSION "0.1.0"
#endif
