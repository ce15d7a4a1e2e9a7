/*
 * This file is part of libpscan
 * Copyright 2019-2024 Board of Regents of the University of Wisconsin System
 * SPDX-License-Identifier: MIT
 */

#pragma once

/**
 * \mainpage libpscan Documentation
 *
 * See namespace \ref pscan for all public symbols.
 */

/**
 * \brief libpscan namespace.
 */
namespace pscan {}

#include "allocate_photons.hpp"
#include "arg_wrappers.hpp"
#include "channels.hpp"
#include "core.hpp"
#include "data_types.hpp"
#include "errors.hpp"
#include "histogram_edges.hpp"
#include "histogram_policies.hpp"
#include "movie.hpp"
#include "movie_config.hpp"
#include "movie_outputs.hpp"
#include "nd_array.hpp"
#include "output_kinds.hpp"
#include "photon_table.hpp"
#include "pipeline.hpp"
#include "reconcile_markers.hpp"
#include "series_stats.hpp"
#include "volume_histogram.hpp"
#include "volume_partition.hpp"
