/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Common.hpp"

namespace Storage {
using namespace StdLib;

/** Byte level access to one input document or one written report, addressed by URI */
class IDataStorage {
public:
    explicit IDataStorage(const String& uri) : mURI(uri) {}
    virtual ~IDataStorage() = default;

    /** LoadData - Whole content of the resource
     * @return Empty if the resource cannot be opened or read
     */
    virtual Optional<ByteStream> LoadData() = 0;

    /** SaveData - Replaces the content of the resource
     * @return False if nothing was written
     */
    virtual bool SaveData(const ByteStream& data) = 0;
    String URI() const { return mURI; }

protected:
    const String mURI;
}; // class IDataStorage
} // namespace Storage
