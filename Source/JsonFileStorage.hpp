/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "FileStorage.hpp"
#include "JsonCommon.hpp"
#include "Value.hpp"
#include "ValueConverter.hpp"

namespace Storage {
class JsonFileStorage : public FileStorage {
public:
    JsonFileStorage(const String& fileName, const SharedPtr<ModuleRegistry>& moduleRegistry, size_t maxDepth = Json::DEFAULT_MAX_DEPTH)
      : FileStorage(fileName, moduleRegistry), mMaxDepth(maxDepth),
        mConvLog(moduleRegistry->LoggerRegistry()->Logger(Module::Name::VALUE_CONV)) {}
    virtual ~JsonFileStorage() = default;

    /** LoadValue - Reads and parses the file into a value tree
     * @return Empty on I/O error, malformed JSON or a document nested deeper than the max depth
     */
    Optional<Json::Value> LoadValue() {
        auto data = LoadData();
        if (!data.has_value()) {
            return {};
        }

        Json::JSON jData;
        try {
            jData = Json::JSON::parse(data.value());
        }
        catch (const Json::JSON::parse_error &ex) {
            mLog->error("Failed to parse JSON data from file '{}'. Error: {}", mURI, ex.what());
            return {};
        }

        try {
            auto value = Json::fFromJson(jData, mMaxDepth);
            mConvLog->trace("Converted JSON document from file '{}'", mURI);
            return value;
        }
        catch (const Json::DepthLimitError &ex) {
            mConvLog->error("Rejected JSON document from file '{}'. Error: {}", mURI, ex.what());
        }
        catch (const Exception &ex) {
            mConvLog->error("Failed to convert JSON document from file '{}'. Error: {}", mURI, ex.what());
        }

        return {};
    }

private:
    size_t mMaxDepth;
    SharedPtr<Log::SpdLogger> mConvLog;
}; // class JsonFileStorage
} // namespace Storage
