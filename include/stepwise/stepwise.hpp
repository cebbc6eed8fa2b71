#pragma once

// Umbrella header for the stepwise library

#include <concepts/effect.hpp>

#include <stepwise/blip.hpp>
#include <stepwise/checkpoint.hpp>
#include <stepwise/composition.hpp>
#include <stepwise/constructors.hpp>
#include <stepwise/console_logger.hpp>
#include <stepwise/driver.hpp>
#include <stepwise/effect.hpp>
#include <stepwise/exceptions.hpp>
#include <stepwise/future.hpp>
#include <stepwise/interval.hpp>
#include <stepwise/logger.hpp>
#include <stepwise/metrics.hpp>
#include <stepwise/persistence.hpp>
#include <stepwise/transducer.hpp>
#include <stepwise/types.hpp>
