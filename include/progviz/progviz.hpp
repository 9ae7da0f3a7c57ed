#pragma once

#include "progviz/common/constants.hpp"
#include "progviz/common/error_codes.hpp"
#include "progviz/core/visualizer.hpp"
#include "progviz/format/summary_formatter.hpp"
#include "progviz/render/progress_renderer.hpp"
#include "progviz/render/time_format.hpp"
#include "progviz/terminal/color.hpp"
#include "progviz/terminal/terminal.hpp"
