#include "sheetbinder/core/FormatRepository.hpp"
#include "sheetbinder/core/Exception.hpp"
#include <mutex>

namespace sheetbinder {
namespace core {

FormatRepository::FormatRepository(StylePtr default_style) {
    if (!default_style) {
        throw ParameterException("FormatRepository requires a default style", "default_style");
    }
    formats_.reserve(64);
    formats_.push_back(default_style);
    hash_to_ids_[default_style->hash()].push_back(DEFAULT_FORMAT_ID);
    pointer_cache_[default_style.get()] = DEFAULT_FORMAT_ID;
}

int FormatRepository::findExisting(const StyleBundle& format) const {
    auto it = hash_to_ids_.find(format.hash());
    if (it == hash_to_ids_.end()) {
        return -1;
    }
    for (int id : it->second) {
        if (*formats_[static_cast<size_t>(id)] == format) {
            return id;
        }
    }
    return -1;
}

int FormatRepository::addFormat(const StylePtr& format) {
    if (!format) {
        return DEFAULT_FORMAT_ID;
    }

    {
        std::shared_lock lock(mutex_);
        auto cached = pointer_cache_.find(format.get());
        if (cached != pointer_cache_.end()) {
            return cached->second;
        }
    }

    std::unique_lock lock(mutex_);

    int id = findExisting(*format);
    if (id < 0) {
        id = static_cast<int>(formats_.size());
        formats_.push_back(format);
        hash_to_ids_[format->hash()].push_back(id);
    }
    pointer_cache_[format.get()] = id;
    return id;
}

StylePtr FormatRepository::getFormat(int id) const {
    std::shared_lock lock(mutex_);
    if (id < 0 || static_cast<size_t>(id) >= formats_.size()) {
        return formats_[DEFAULT_FORMAT_ID];
    }
    return formats_[static_cast<size_t>(id)];
}

}} // namespace sheetbinder::core
