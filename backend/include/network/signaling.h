#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/// Raised when an offer/answer blob cannot be used or a negotiation step is
/// called out of order.
class NegotiationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Connection descriptions exchanged through the room registry, plus the
 * two handshake frames sent once the TCP connection exists.
 */
namespace signaling {

struct Candidate {
    std::string address;
    uint16_t    port = 0;
};

/// Published by the initiator.
struct Offer {
    std::string            session;
    std::vector<Candidate> candidates;
};

/// Published by the responder; `token` proves the connection belongs to it.
struct Answer {
    std::string session;
    std::string token;
};

std::string encode_offer(const Offer& offer);
std::string encode_answer(const Answer& answer);

/// Both throw NegotiationError for malformed blobs.
Offer decode_offer(const std::string& blob);
Answer decode_answer(const std::string& blob);

/// First frame on a fresh connection, sent by the responder.
std::string encode_hello(const Answer& answer);
std::optional<Answer> decode_hello(const std::string& body);

/// Initiator's reply once the hello matched.
std::string encode_ack(const std::string& session);
bool is_ack_for(const std::string& body, const std::string& session);

} // namespace signaling
