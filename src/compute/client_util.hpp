#pragma once

#include <algorithm>
#include <chrono>
#include <map>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "compute_sdk_interface.hpp"

namespace gceclient {

/**
 * Extract the short name from a resource self link.
 *
 * "https://www.googleapis.com/compute/v1/projects/p/zones/us-west1-a" yields
 * "us-west1-a". A string without '/' is returned unchanged.
 */
std::string nameFromSelfLink(const std::string& self_link);

/**
 * Build an API filter expression matching every given label.
 *
 * {"env": "prod", "team": "ci"} yields "(labels.env eq prod) (labels.team eq ci)".
 */
std::string buildLabelsFilterString(const std::map<std::string, std::string>& labels);

bool equalsIgnoreCase(const std::string& a, const std::string& b);

// A missing deprecation status counts as not deprecated
bool isDeprecated(const compute_v1::DeprecationStatus* deprecated);

template <typename Resource>
bool isDeprecatedResource(const Resource& resource) {
    return isDeprecated(resource.has_deprecated() ? &resource.deprecated() : nullptr);
}

template <typename Resource>
bool compareByName(const Resource& a, const Resource& b) {
    return a.name() < b.name();
}

// Keep the items accepted by filter, sorted with compare
template <typename T, typename Filter, typename Compare>
std::vector<T> processResourceList(std::vector<T> items, Filter filter, Compare compare) {
    items.erase(std::remove_if(items.begin(), items.end(),
                               [&filter](const T& item) { return !filter(item); }),
                items.end());
    std::sort(items.begin(), items.end(), compare);
    return items;
}

template <typename T, typename Compare>
std::vector<T> processResourceList(std::vector<T> items, Compare compare) {
    std::sort(items.begin(), items.end(), compare);
    return items;
}

/**
 * Merge two metadata item lists by key.
 *
 * Returns all of winner in order, then every loser item whose key does not
 * appear in winner, in order. A null loser is treated as empty.
 */
std::vector<compute_v1::Items> mergeMetadataItems(
    const std::vector<compute_v1::Items>& winner,
    const std::vector<compute_v1::Items>* loser);

// Argument checks, reported as kInvalidArgument
Status checkNotEmpty(std::string_view value, const char* name);
// Checks (name, value) pairs in order; the first empty value is reported
Status checkNotEmpty(std::initializer_list<std::pair<const char*, std::string_view>> args);
Status checkTimeout(std::chrono::milliseconds timeout);

} // namespace gceclient
