#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

// smallest maze edge the builder accepts
constexpr int32_t kMinMazeSize = 4;

constexpr int32_t kDefaultMinValidPaths = 3;
