/**
 * Signaling: offer and answer blobs, and the hello/ack frames that
 * authenticate a fresh TCP connection.
 */

#include "network/signaling.h"

#include <asio.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace signaling {

namespace {

json parse_blob(const std::string& blob, const char* expected_type) {
    json j;
    try {
        j = json::parse(blob);
    } catch (const json::parse_error& ex) {
        throw NegotiationError(std::string("unparseable ") + expected_type + ": " + ex.what());
    }
    if (!j.is_object() || j.value("type", "") != expected_type) {
        throw NegotiationError(std::string("blob is not an ") + expected_type);
    }
    return j;
}

std::string required_string(const json& j, const char* key, const char* what) {
    if (!j.contains(key) || !j.at(key).is_string() || j.at(key).get<std::string>().empty()) {
        throw NegotiationError(std::string(what) + " without " + key);
    }
    return j.at(key).get<std::string>();
}

} // namespace

std::string encode_offer(const Offer& offer) {
    json candidates = json::array();
    for (const auto& c : offer.candidates) {
        candidates.push_back({{"address", c.address}, {"port", c.port}});
    }
    return json{
        {"type", "offer"},
        {"session", offer.session},
        {"candidates", candidates},
    }.dump();
}

std::string encode_answer(const Answer& answer) {
    return json{
        {"type", "answer"},
        {"session", answer.session},
        {"token", answer.token},
    }.dump();
}

Offer decode_offer(const std::string& blob) {
    const json j = parse_blob(blob, "offer");

    Offer offer;
    offer.session = required_string(j, "session", "offer");

    const auto it = j.find("candidates");
    if (it == j.end() || !it->is_array() || it->empty()) {
        throw NegotiationError("offer without candidates");
    }
    for (const auto& c : *it) {
        if (!c.is_object() || !c.contains("port") || !c.at("port").is_number_unsigned()) {
            throw NegotiationError("offer candidate without a port");
        }
        Candidate candidate;
        candidate.address = required_string(c, "address", "offer candidate");
        const auto port = c.at("port").get<std::uint64_t>();
        if (port == 0 || port > 65535) {
            throw NegotiationError("offer candidate port out of range");
        }
        candidate.port = static_cast<uint16_t>(port);

        asio::error_code ec;
        asio::ip::make_address(candidate.address, ec);
        if (ec) {
            throw NegotiationError("offer candidate address is invalid: " + candidate.address);
        }
        offer.candidates.push_back(std::move(candidate));
    }
    return offer;
}

Answer decode_answer(const std::string& blob) {
    const json j = parse_blob(blob, "answer");
    Answer answer;
    answer.session = required_string(j, "session", "answer");
    answer.token = required_string(j, "token", "answer");
    return answer;
}

std::string encode_hello(const Answer& answer) {
    return json{{"hello", {{"session", answer.session}, {"token", answer.token}}}}.dump();
}

std::optional<Answer> decode_hello(const std::string& body) {
    const json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    const auto it = j.find("hello");
    if (it == j.end() || !it->is_object()) return std::nullopt;

    const auto session = it->find("session");
    const auto token = it->find("token");
    if (session == it->end() || !session->is_string()) return std::nullopt;
    if (token == it->end() || !token->is_string()) return std::nullopt;

    Answer hello;
    hello.session = session->get<std::string>();
    hello.token = token->get<std::string>();
    if (hello.session.empty() || hello.token.empty()) return std::nullopt;
    return hello;
}

std::string encode_ack(const std::string& session) {
    return json{{"ack", session}}.dump();
}

bool is_ack_for(const std::string& body, const std::string& session) {
    const json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return false;
    const auto it = j.find("ack");
    return it != j.end() && it->is_string() && it->get<std::string>() == session;
}

} // namespace signaling
