/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      Globals.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Definitions of the shared global configuration.
 * =================================================================================
 */
#include "Globals.h"
#include "Config.h"

// =================================================================================
// SECTION: CONFIGURATION
// =================================================================================

CubeDefaults g_cubeDefaults = DEFAULT_CUBE_DEFS;
CubeSettings g_cubeSettings = DEFAULT_CUBE_SETTINGS;
