#include "transport/NulFrameCodec.h"

namespace TEB {

std::string NulFrameCodec::encode(const json &message) {
    std::string frame = message.dump();
    frame.push_back('\0');
    return frame;
}

std::vector<std::string> NulFrameCodec::feed(const char *data, size_t size) {
    std::vector<std::string> frames;
    size_t start = 0;
    for (size_t i = 0; i < size; ++i) {
        if (data[i] != '\0') {
            continue;
        }
        pending_.append(data + start, i - start);
        frames.push_back(std::move(pending_));
        pending_.clear();
        start = i + 1;
    }
    pending_.append(data + start, size - start);
    return frames;
}

}  // namespace TEB
