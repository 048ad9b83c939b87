#pragma once

/**
 * @file handctl.h
 * @brief Main header for the handctl gesture control library
 *
 * Include this single header to access the complete gesture pipeline.
 *
 * @version 1.0.0
 * @copyright 2025 handctl Project
 * @license MIT License
 */

// Core types and utilities
#include "handctl/core/types.hpp"
#include "handctl/core/Logger.hpp"
#include "handctl/core/Configuration.hpp"
#include "handctl/core/exception.h"

// Gesture pipeline
#include "handctl/gesture/GestureTypes.hpp"
#include "handctl/gesture/HandGeometry.hpp"
#include "handctl/gesture/FingerStateClassifier.hpp"
#include "handctl/gesture/GestureClassifier.hpp"
#include "handctl/gesture/GestureStabilizer.hpp"
#include "handctl/gesture/PalmControlExtractor.hpp"
#include "handctl/gesture/PinchDebouncer.hpp"
#include "handctl/gesture/RotationMomentum.hpp"
#include "handctl/gesture/GesturePipeline.hpp"
#include "handctl/gesture/FrameGate.hpp"
#include "handctl/gesture/LandmarkRecording.hpp"
#include "handctl/gesture/DebugOverlay.hpp"
