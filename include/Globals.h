/*
 * =================================================================================
 * Project:   Cube Alarm - Smart Cube Wake-Up Alarm
 * File:      Globals.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Shared global configuration: the active link timing table and the user
 * settings currently applied to the engine.
 * =================================================================================
 */
#ifndef GLOBALS_H
#define GLOBALS_H

#include <Arduino.h>

#include "Config.h"

// =================================================================================
// SECTION: CONFIGURATION
// =================================================================================
extern CubeDefaults g_cubeDefaults;
extern CubeSettings g_cubeSettings;

#endif
