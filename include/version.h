#pragma once

/**
 * @file version.h
 * @brief Version information for the population relief map generator
 */

#define POPRELIEF_VERSION_MAJOR 1
#define POPRELIEF_VERSION_MINOR 0
#define POPRELIEF_VERSION_PATCH 0
#define POPRELIEF_VERSION_STRING "1.0.0"
