#pragma once
#include <string_view>
#include <ecsuite/crypto/pointers.hpp>

namespace ecsuite::crypto::akey
{

namespace ec
{

/// @brief Generates an EC key pair on the named group ("prime256v1", "P-384", "secp521r1", ...).
KeyPtr generate(std::string_view groupName);

} // namespace ec

} // namespace ecsuite::crypto::akey
