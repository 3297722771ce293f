/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "IDataStorage.hpp"
#include "Common.hpp"
#include "Modules.hpp"
#include "Lib/ModuleRegistry.hpp"

#include <filesystem>
#include <iterator>

namespace Storage {
class FileStorage : public IDataStorage {
public:
    FileStorage(const String& fileName, const SharedPtr<ModuleRegistry>& moduleRegistry)
      : IDataStorage(fileName), mModuleRegistry(moduleRegistry), mLog(moduleRegistry->LoggerRegistry()->Logger(Module::Name::DATA_STORAGE)) {}
    virtual ~FileStorage() = default;

    virtual Optional<ByteStream> LoadData() override {
        IFStream file(mURI, std::ios_base::binary);
        if (!file.is_open()) {
            mLog->error("Failed to open file '{}'", mURI);
            return {};
        }

        ByteStream data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            mLog->error("Failed to read file '{}'", mURI);
            return {};
        }

        mLog->trace("Read {} bytes from file '{}'", data.size(), mURI);
        return data;
    }

    /** SaveData - Writes through a temporary file renamed over the target, so readers never see a partial file */
    virtual bool SaveData(const ByteStream& data) override {
        auto tmpFileName = mURI + ".tmp";
        OFStream tmpFile(tmpFileName, std::ios_base::binary | std::ios_base::trunc);
        if (!tmpFile.is_open()) {
            mLog->error("Failed to open file {} to save data", tmpFileName);
            return false;
        }

        tmpFile.write(reinterpret_cast<const char*>(data.data()), data.size());
        tmpFile.flush();
        tmpFile.close();
        if (!tmpFile.good()) {
            mLog->error("Failed to save data to file {}", tmpFileName);
            std::error_code removeErrCode = {};
            std::filesystem::remove(std::filesystem::path(tmpFileName), removeErrCode);
            return false;
        }

        std::error_code errCode = {};
        std::filesystem::rename(std::filesystem::path(tmpFileName), mURI, errCode);
        if (errCode) {
            mLog->error("Failed to save temporary filename {} into target filename {}. Error: {}",
                tmpFileName, mURI, errCode.message());
            errCode.clear();
            std::filesystem::remove(std::filesystem::path(tmpFileName), errCode);
            return false;
        }

        mLog->debug("Saved {} bytes into file '{}'", data.size(), mURI);
        return true;
    }

protected:
    SharedPtr<ModuleRegistry> mModuleRegistry;
    SharedPtr<Log::SpdLogger> mLog;
}; // class FileStorage
} // namespace Storage
