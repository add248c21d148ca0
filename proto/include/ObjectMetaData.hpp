#pragma once

#include "object.pb.h"

#include <filesystem>
#include <string>

ObjectMetaData MakeObjectMetaDataFrom(const std::filesystem::path& from, const std::string& container,
                                      const std::string& key, const std::string& etag);
std::string ObjectMetaDataToString(const ObjectMetaData& metadata);
