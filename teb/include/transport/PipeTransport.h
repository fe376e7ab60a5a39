#pragma once

#include "transport/NulFrameCodec.h"
#include "transport/StreamTransportBase.h"

namespace TEB {

/**
 * @brief Transport over a pair of inherited pipe descriptors
 *
 * Frames are NUL-terminated JSON. A frame that does not parse as JSON closes
 * the transport. Takes ownership of both descriptors.
 */
class PipeTransport : public StreamTransportBase {
public:
    /**
     * @param writeFd Host end the child reads from
     * @param readFd Host end the child writes to
     */
    PipeTransport(EventLoop &loop, int writeFd, int readFd);

    void send(const json &message) override;
    void close() override;

protected:
    void onBytes(const char *data, size_t size) override;

private:
    NulFrameCodec codec_;
};

}  // namespace TEB
