/**
 * @file ConnectionCodec.cpp
 * @brief base64(JSON) descriptor codec using nlohmann/json and OpenSSL EVP base64
 */

#include "peerdrop/ConnectionCodec.h"
#include "peerdrop/ErrorCodes.h"
#include "peerdrop/config.h"

#include <openssl/evp.h>
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstring>

using json = nlohmann::json;

namespace PeerDrop {

namespace {

bool isBase64Char(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '/';
}

std::string trimWhitespace(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

bool readStringField(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

// Session description as {type, sdp}; a bare SDP string is accepted too
bool readSessionDescription(const json& j, std::string& out) {
    auto it = j.find("sdp");
    if (it == j.end()) {
        return false;
    }
    if (it->is_string()) {
        out = it->get<std::string>();
        return true;
    }
    if (!it->is_object()) {
        return false;
    }
    auto type = it->find("type");
    if (type != it->end() && !type->is_string()) {
        return false;
    }
    return readStringField(*it, "sdp", out);
}

}  // namespace

const char* descriptorRoleToString(DescriptorRole role) {
    switch (role) {
        case DescriptorRole::Offer:  return DESCRIPTOR_TYPE_OFFER;
        case DescriptorRole::Answer: return DESCRIPTOR_TYPE_ANSWER;
        default:                     return "unknown";
    }
}

//=============================================================================
// Base64
//=============================================================================

std::string ConnectionCodec::base64Encode(const uint8_t* data, size_t size)
{
    if (!data || size == 0) {
        return {};
    }

    // EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a NUL terminator
    std::string out(4 * ((size + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                        data, static_cast<int>(size));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

bool ConnectionCodec::base64Decode(const std::string& text, std::vector<uint8_t>& out)
{
    if (text.empty() || text.size() % 4 != 0) {
        return false;
    }

    // EVP_DecodeBlock is lenient about padding placement, so validate first
    size_t padding = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '=') {
            if (i < text.size() - 2) {
                return false;
            }
            ++padding;
        } else if (padding > 0 || !isBase64Char(c)) {
            return false;
        }
    }

    std::vector<uint8_t> buffer(3 * (text.size() / 4));
    const int decoded = EVP_DecodeBlock(buffer.data(),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        return false;
    }

    // EVP_DecodeBlock counts padding as zero bytes
    buffer.resize(static_cast<size_t>(decoded) - padding);
    out.swap(buffer);
    return true;
}

//=============================================================================
// Descriptor Codec
//=============================================================================

std::string ConnectionCodec::encode(const ConnectionDescriptor& descriptor)
{
    json j;
    j["type"] = descriptorRoleToString(descriptor.role);
    j["sdp"] = {
        {"type", descriptorRoleToString(descriptor.role)},
        {"sdp", descriptor.transportDescription}
    };
    j["peerId"] = descriptor.peerId;
    j["peerName"] = descriptor.peerDisplayName;

    const std::string text = j.dump();
    return base64Encode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

bool ConnectionCodec::decode(const std::string& code,
                             ConnectionDescriptor& out,
                             std::string& errorMsg)
{
    std::vector<uint8_t> raw;
    if (!base64Decode(trimWhitespace(code), raw)) {
        errorMsg = formatError(ErrorCodes::MALFORMED_DESCRIPTOR,
                               "Connection code is not valid base64");
        return false;
    }

    json j = json::parse(raw.begin(), raw.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        errorMsg = formatError(ErrorCodes::MALFORMED_DESCRIPTOR,
                               "Connection code does not contain a JSON object");
        return false;
    }

    std::string type;
    ConnectionDescriptor descriptor;
    if (!readStringField(j, "type", type) ||
        !readSessionDescription(j, descriptor.transportDescription) ||
        !readStringField(j, "peerId", descriptor.peerId) ||
        !readStringField(j, "peerName", descriptor.peerDisplayName)) {
        errorMsg = formatError(ErrorCodes::MALFORMED_DESCRIPTOR,
                               "Connection code is missing type, sdp, peerId or peerName");
        return false;
    }

    if (type == DESCRIPTOR_TYPE_OFFER) {
        descriptor.role = DescriptorRole::Offer;
    } else if (type == DESCRIPTOR_TYPE_ANSWER) {
        descriptor.role = DescriptorRole::Answer;
    } else {
        errorMsg = formatError(ErrorCodes::MALFORMED_DESCRIPTOR,
                               "Unknown descriptor type: " + type);
        return false;
    }

    if (descriptor.peerId.empty() || descriptor.transportDescription.empty()) {
        errorMsg = formatError(ErrorCodes::MALFORMED_DESCRIPTOR,
                               "Connection code has an empty peerId or sdp");
        return false;
    }

    out = std::move(descriptor);
    return true;
}

}  // namespace PeerDrop
