#include "../include/ObjectId.hpp"
#include "../include/utils.hpp"

#include <stdexcept>

std::string_view objectHashName(ObjectHash kind) {
    switch (kind) {
        case ObjectHash::Sha1:   return "sha1";
        case ObjectHash::Sha256: return "sha256";
    }
    return "unknown";
}

ObjectHash parseObjectHash(std::string_view name) {
    std::string lowered {toLower(std::string{name})};
    if (lowered == "sha1") return ObjectHash::Sha1;
    else if (lowered == "sha256") return ObjectHash::Sha256;
    else throw std::invalid_argument("Unknown object format: " + std::string{name});
}

ObjectId::ObjectId(std::string_view binary): bytes(binary) {
    if (bytes.size() != hashLength(ObjectHash::Sha1) && bytes.size() != hashLength(ObjectHash::Sha256))
        throw std::invalid_argument("Object id must be 20 or 32 bytes long, got: " + std::to_string(bytes.size()));
}

ObjectId ObjectId::fromHex(std::string_view hex) {
    return ObjectId{hex2Binary(hex)};
}

ObjectId ObjectId::null(ObjectHash kind) {
    return ObjectId{std::string(hashLength(kind), '\0')};
}

ObjectHash ObjectId::kind() const {
    return bytes.size() == hashLength(ObjectHash::Sha256)? ObjectHash::Sha256: ObjectHash::Sha1;
}

std::uint8_t ObjectId::firstByte() const {
    if (bytes.empty())
        throw std::logic_error("firstByte() called on an empty object id");
    return static_cast<std::uint8_t>(bytes.front());
}

std::string ObjectId::hex() const { return hashutil::toHex(bytes); }

ObjectHasher::ObjectHasher(ObjectHash kind) {
    if (kind == ObjectHash::Sha256) hasher.emplace<hashutil::Sha256>();
    else hasher.emplace<hashutil::Sha1>();
}

ObjectHasher &ObjectHasher::update(std::string_view data) {
    std::visit([data](auto &h) { h.update(data); }, hasher);
    return *this;
}

ObjectId ObjectHasher::digest() const {
    return std::visit([](const auto &h) { return ObjectId{h.digest()}; }, hasher);
}
