/**
 * @file istorageclient.cpp
 * @brief Implementation file for IStorageClient interface.
 *
 * This file exists to support Qt's MOC (Meta-Object Compiler), which needs a
 * translation unit for the interface's QObject infrastructure.
 */

#include "istorageclient.h"
