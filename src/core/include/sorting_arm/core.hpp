#pragma once
/**
 * @file core.hpp
 * @brief Main include file for Sorting Arm Core
 */

#include "../../src/logging/Logger.hpp"
#include "../../src/config/ConfigManager.hpp"
#include "../../src/controller/ArmController.hpp"
#include "../../src/geometry/CoordinateTransform.hpp"
#include "../../src/sorting/SortingOrchestrator.hpp"
#include "../../src/vision/FrameGrabber.hpp"
#include "../../src/vision/ScriptedDetector.hpp"
