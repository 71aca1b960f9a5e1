#pragma once

// GRIDBATTLE_VERSION comes from the CMake project version; plain compiles get "dev".
#ifndef GRIDBATTLE_VERSION
#define GRIDBATTLE_VERSION "dev"
#endif

#ifndef GRIDBATTLE_APPNAME
#define GRIDBATTLE_APPNAME "GridBattle"
#endif
