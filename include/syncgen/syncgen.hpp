#pragma once

#include <syncgen/config.hpp>
#include <syncgen/options.hpp>

#include <syncgen/detail/error_detail.hpp>
#include <syncgen/detail/log.hpp>
#include <syncgen/detail/result.hpp>

#include <syncgen/account/types.hpp>
#include <syncgen/account/defaults.hpp>

#include <syncgen/artifact/unit_sections.hpp>
#include <syncgen/artifact/service.hpp>
#include <syncgen/artifact/timer.hpp>
#include <syncgen/artifact/config_file.hpp>

#include <syncgen/codec/toml.hpp>
#include <syncgen/codec/unit_file.hpp>

#include <syncgen/compiler.hpp>

// Outer adapters
#include <syncgen/registry/registry.hpp>
#include <syncgen/registry/yaml_loader.hpp>
#include <syncgen/emit/writer.hpp>
