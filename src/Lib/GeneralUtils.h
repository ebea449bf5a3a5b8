//
// General helpers shared by every component: encoding, diagnostics and test support
//

#ifndef STAGING_GATEWAY_GENERALUTILS_H
#define STAGING_GATEWAY_GENERALUTILS_H

#include <cstdint>
#include <exception>
#include <string>

auto base64Encode(std::string input) -> std::string;
auto base64Decode(std::string input) -> std::string;
auto isValidBase64(const std::string& input) -> bool;
auto isValidUtf8(const std::string& input) -> bool;
auto generateUUID() -> std::string;
void dumpExceptions(std::exception& exception);
void handleSegv();
auto acceptingConnections(uint16_t port) -> bool;

#endif //STAGING_GATEWAY_GENERALUTILS_H
