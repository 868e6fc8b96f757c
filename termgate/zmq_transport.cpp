#include "zmq_transport.h"
#include <stdexcept>

namespace termgate {

ZmqTransport::ZmqTransport(std::chrono::milliseconds timeout) : timeout{timeout} {
    if (timeout.count() <= 0)
        throw std::out_of_range("Invalid ZmqTransport timeout: must be > 0");
}

std::string ZmqTransport::rpc(const Asset& asset, std::string_view request) {
    zmq::socket_t sock{context, zmq::socket_type::req};
    sock.set(zmq::sockopt::linger, 0);
    sock.set(zmq::sockopt::sndtimeo, static_cast<int>(timeout.count()));
    sock.set(zmq::sockopt::rcvtimeo, static_cast<int>(timeout.count()));
    sock.connect(asset.endpoint);

    zmq::message_t msg{request.data(), request.size()};
    if (!sock.send(msg, zmq::send_flags::none))
        throw std::runtime_error("Timed out sending request to worker " + asset.endpoint);

    zmq::message_t reply;
    if (!sock.recv(reply))
        throw std::runtime_error("Timed out waiting for a response from worker " + asset.endpoint);
    if (reply.more())
        throw std::runtime_error("Invalid multi-part response from worker " + asset.endpoint);
    return reply.to_string();
}

}
