#ifndef CLOCKSIM_CONFIG_H
#define CLOCKSIM_CONFIG_H

#include <chrono>
#include <cstdint>
#include <string>

using frame_id_t = int32_t;  // frame id type
using page_id_t = std::string;  // page tokens compare as exact strings

static constexpr frame_id_t INVALID_FRAME_ID = -1;  // no frame highlighted

static constexpr uint32_t DEFAULT_FRAME_COUNT = 3;
static constexpr uint32_t MAX_FRAME_COUNT = 64;
static const char *const DEFAULT_REFERENCE_STRING = "1,2,3,4,1,2,5,1,2,3,4,5";

// play speed slider, interval = SPEED_SLIDER_BASE - slider
static constexpr int MIN_SPEED_SLIDER = 50;
static constexpr int MAX_SPEED_SLIDER = 1950;
static constexpr int SPEED_SLIDER_BASE = 2000;
static constexpr std::chrono::milliseconds DEFAULT_PLAY_INTERVAL{1000};

// execfile scripts may call execfile up to this depth
static constexpr uint32_t MAX_EXECFILE_DEPTH = 16;

#endif  // CLOCKSIM_CONFIG_H
