#pragma once

#include <initializer_list>
#include <string>

#include <cstdint>

namespace masterlist::config {

bool ReadBoolConfig(std::initializer_list<const char*> paths, bool defaultValue);
uint16_t ReadUInt16Config(std::initializer_list<const char*> paths, uint16_t defaultValue);
int ReadIntConfig(std::initializer_list<const char*> paths, int defaultValue);
uint64_t ReadUInt64Config(const char *path, uint64_t defaultValue);
std::string ReadStringConfig(const char *path, const std::string &defaultValue);

} // namespace masterlist::config
