#pragma once

#include "common/JsonUtils.h"
#include <string>
#include <vector>

namespace TEB {

/**
 * @brief NUL-terminated frame codec of the pipe side channel
 *
 * A frame is the UTF-8 JSON text followed by one '\0'. The decoder keeps any
 * trailing partial frame until the next feed().
 */
class NulFrameCodec {
public:
    static std::string encode(const json &message);

    /**
     * @brief Append raw bytes and return the frames they complete, in order
     */
    std::vector<std::string> feed(const char *data, size_t size);

    size_t pendingBytes() const {
        return pending_.size();
    }

private:
    std::string pending_;
};

}  // namespace TEB
