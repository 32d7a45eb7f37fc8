// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of XmlSpan, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file xmlspan.hpp
/// \brief Umbrella header for XmlSpan.

#include <xmlspan/core/config_loader.hpp>
#include <xmlspan/core/logger.hpp>
#include <xmlspan/document_parser.hpp>
#include <xmlspan/error.hpp>
#include <xmlspan/options.hpp>
#include <xmlspan/parse_result.hpp>
#include <xmlspan/parsers/minimal_toml.hpp>
#include <xmlspan/parsers/xml_scanner.hpp>
#include <xmlspan/text/position_index.hpp>
#include <xmlspan/text/text_normalizer.hpp>
#include <xmlspan/tree/element.hpp>
#include <xmlspan/tree/scan_event.hpp>
#include <xmlspan/tree/tree_builder.hpp>
