#ifndef WTENV_VERSION_HPP
#define WTENV_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                    */
#define WTENV_VERSION_MAJOR 0
#define WTENV_VERSION_MINOR 3
#define WTENV_VERSION_PATCH 0

#define WTENV_VERSION_STR "0.3.0"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* WTENV_VERSION = WTENV_VERSION_STR;

/* Registry document format written by this build. */
constexpr int WTENV_REGISTRY_VERSION = 1;

#endif /* WTENV_VERSION_HPP */
