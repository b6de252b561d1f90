#include "client_util.hpp"
#include <cctype>
#include <set>
#include <sstream>

namespace gceclient {

std::string nameFromSelfLink(const std::string& self_link) {
    auto pos = self_link.find_last_of('/');
    if (pos == std::string::npos) {
        return self_link;
    }
    return self_link.substr(pos + 1);
}

std::string buildLabelsFilterString(const std::map<std::string, std::string>& labels) {
    std::ostringstream filter;
    bool first = true;
    for (const auto& [key, value] : labels) {
        if (!first) {
            filter << " ";
        }
        filter << "(labels." << key << " eq " << value << ")";
        first = false;
    }
    return filter.str();
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool isDeprecated(const compute_v1::DeprecationStatus* deprecated) {
    return deprecated != nullptr && equalsIgnoreCase(deprecated->state(), "DEPRECATED");
}

std::vector<compute_v1::Items> mergeMetadataItems(
    const std::vector<compute_v1::Items>& winner,
    const std::vector<compute_v1::Items>* loser)
{
    std::vector<compute_v1::Items> result(winner);
    if (loser == nullptr) {
        return result;
    }

    std::set<std::string> winner_keys;
    for (const auto& item : winner) {
        winner_keys.insert(item.key());
    }
    for (const auto& item : *loser) {
        if (winner_keys.count(item.key()) == 0) {
            result.push_back(item);
        }
    }
    return result;
}

Status checkNotEmpty(std::string_view value, const char* name) {
    if (value.empty()) {
        return Status(StatusCode::kInvalidArgument, std::string(name) + " must not be empty");
    }
    return Status();
}

Status checkNotEmpty(std::initializer_list<std::pair<const char*, std::string_view>> args) {
    for (const auto& [name, value] : args) {
        Status status = checkNotEmpty(value, name);
        if (!status.ok()) {
            return status;
        }
    }
    return Status();
}

Status checkTimeout(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return Status(StatusCode::kInvalidArgument,
                      "timeout must be positive, got " + std::to_string(timeout.count()) + "ms");
    }
    return Status();
}

} // namespace gceclient
