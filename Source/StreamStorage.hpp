/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "IDataStorage.hpp"
#include "Common.hpp"
#include "Lib/ModuleRegistry.hpp"
#include "Lib/Utils.hpp"
#include "Modules.hpp"

namespace Storage {
/*
    Reads one document typed or pasted into an input stream.
    The document ends at the first blank line that follows some content, or at the end of
    the stream. Leading blank lines are skipped. Several documents can be read one after
    another from the same stream.
*/
class StreamStorage : public IDataStorage {
public:
    StreamStorage(const String& name, IStream& input, const SharedPtr<ModuleRegistry>& moduleRegistry)
      : IDataStorage(name), mInput(input), mModuleRegistry(moduleRegistry), mLog(moduleRegistry->LoggerRegistry()->Logger(Module::Name::DATA_STORAGE)) {}
    virtual ~StreamStorage() = default;

    Optional<ByteStream> LoadData() override {
        Vector<String> lines;
        String line;
        while (std::getline(mInput, line)) {
            if (Utils::fTrim(line).empty()) {
                if (lines.empty()) {
                    continue;
                }

                break;
            }

            lines.push_back(line);
        }

        if (mInput.bad()) {
            mLog->error("Failed to read {} from input stream", mURI);
            return {};
        }

        mLog->trace("Read {} lines of {} from input stream", lines.size(), mURI);
        return fToByteStream(Utils::fJoin(lines, "\n"));
    }

    bool SaveData([[maybe_unused]] const ByteStream& data) override {
        mLog->error("Input stream {} cannot be written", mURI);
        return false;
    }

private:
    IStream& mInput;
    SharedPtr<ModuleRegistry> mModuleRegistry;
    SharedPtr<Log::SpdLogger> mLog;
}; // class StreamStorage
} // namespace Storage
