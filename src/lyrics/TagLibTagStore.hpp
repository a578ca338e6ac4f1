#pragma once
// TagLibTagStore.hpp - TagStore backed by TagLib property maps

#include "lyrics/TagStore.hpp"

namespace cal::lyrics {

class TagLibTagStore : public TagStore {
public:
    Result<TagFields> read(const std::string& filePath) override;
    Result<void> write(const std::string& filePath,
                       const TagFields& fields) override;
};

} // namespace cal::lyrics
