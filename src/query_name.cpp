#include "query_name.hpp"
#include "types_utils.hpp"

#include <cstddef>
#include <stdexcept>

#include <fmt/core.h>

namespace mdns_client
{

namespace
{

constexpr std::size_t kMaxLabelLength = 63;
constexpr std::size_t kMaxNameLength = 255;

}

void ValidateQueryName(std::string_view name)
{
    const std::string_view normalized = NormalizeName(name);
    if (normalized.empty()) {
        throw std::invalid_argument("Empty DNS name.");
    }

    std::size_t encodedLength = 1; // terminating zero label
    std::size_t start = 0;
    while (start <= normalized.size()) {
        std::size_t end = normalized.find('.', start);
        if (end == std::string_view::npos) {
            end = normalized.size();
        }
        const std::string_view label = normalized.substr(start, end - start);
        if (label.empty()) {
            throw std::invalid_argument(fmt::format("Empty label in DNS name \"{}\".", name));
        }
        if (label.size() > kMaxLabelLength) {
            throw std::invalid_argument(fmt::format("Label \"{}\" is longer than {} bytes.", label, kMaxLabelLength));
        }
        encodedLength += label.size() + 1;
        if (encodedLength > kMaxNameLength) {
            throw std::invalid_argument(fmt::format("DNS name \"{}\" is longer than {} bytes.", name, kMaxNameLength));
        }
        start = end + 1;
    }
}

}
