#pragma once

#include <gmock/gmock.h>

#include "StorageClient.hpp"

class MockStorageClient : public StorageClient
{
public:
    using BoolResult = std::tuple<bool, bool, Error>;
    using StringResult = std::tuple<bool, std::string, Error>;

    MOCK_METHOD(BoolResult, ContainerExists, (const std::string& container), (override));
    MOCK_METHOD(BoolResult, ObjectExists, (const std::string& container, const std::string& key), (override));
    MOCK_METHOD(StringResult, CreateMultipartSession, (const std::string& container, const std::string& key), (override));
    MOCK_METHOD(StringResult, UploadPart, (const std::string& session_id, uint32_t index, std::string_view data), (override));
    MOCK_METHOD(std::optional<Error>, CompleteMultipartSession, (const std::string& session_id, const std::vector<CompletedPart>& parts), (override));
    MOCK_METHOD(std::optional<Error>, AbortMultipartSession, (const std::string& session_id), (override));
    MOCK_METHOD(std::optional<Error>, PutObjectDirect, (const std::string& container, const std::string& key, std::string_view data), (override));
};
