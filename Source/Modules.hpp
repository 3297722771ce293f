#pragma once

#include "Lib/StdLib.hpp"

namespace Module {
namespace Name {
    using namespace StdLib;
    const String COMPARE_JOB = "CmpJob";
    const String DATA_STORAGE = "DataStorage";
    const String DIFF_ENGINE = "DiffEngine";
    const String RENDERER = "Renderer";
    const String VALUE_CONV = "ValueConv";
} // namespace Name
} // namespace Module
