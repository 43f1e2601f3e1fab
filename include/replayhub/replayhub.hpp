/**
 * @file replayhub.hpp
 * @brief Umbrella header.
 */

#pragma once

#include "replayhub/errors.hpp"
#include "replayhub/logging.hpp"
#include "replayhub/looping_series_store.hpp"
#include "replayhub/sequence.hpp"
#include "replayhub/series_loader.hpp"
#include "replayhub/snapshot_poller.hpp"
#include "replayhub/subscription_hub.hpp"
