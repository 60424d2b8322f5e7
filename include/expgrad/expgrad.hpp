#pragma once

// Umbrella header

#include <expgrad/channels.hpp>
#include <expgrad/color.hpp>
#include <expgrad/error.hpp>
#include <expgrad/exponential_gradient.hpp>
#include <expgrad/export.hpp>
#include <expgrad/gradient.hpp>
#include <expgrad/logger.hpp>
#include <expgrad/raster.hpp>
