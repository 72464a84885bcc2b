#pragma once

#include <tlvtree/builder.hpp>
#include <tlvtree/byte_source.hpp>
#include <tlvtree/config.hpp>
#include <tlvtree/decoder.hpp>
#include <tlvtree/encoder.hpp>
#include <tlvtree/error.hpp>
#include <tlvtree/error_info.hpp>
#include <tlvtree/expected.hpp>
#include <tlvtree/logger.hpp>
#include <tlvtree/mutate.hpp>
#include <tlvtree/record.hpp>
#include <tlvtree/registry.hpp>
#include <tlvtree/tree.hpp>
#include <tlvtree/type.hpp>
