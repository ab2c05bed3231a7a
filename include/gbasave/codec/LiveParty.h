#pragma once
#include <memory>
#include <vector>

#include "gbasave/common/Loggable.h"
#include "gbasave/codec/CreatureRecord.h"
#include "gbasave/codec/GameProfile.h"
#include "gbasave/codec/MemorySource.h"
#include "gbasave/codec/SaveStatus.h"

namespace GBASave::Codec {

    // The party as it sits in emulator RAM, decoded with the same record
    // codec as the save file. The source must outlive this object; the
    // profile is copied and shared with every record read.
    class LiveParty : public Common::Loggable {
    public:
        LiveParty(MemorySource& source, const GameProfile& profile);

        // Stops at the first empty record, as for saves. Records failing their
        // checksum are kept and logged.
        SaveStatus Read(std::vector<CreatureRecord>& out);

        // Stores the records, zero-filling unused slots, then the count byte.
        SaveStatus Write(const std::vector<CreatureRecord>& roster);

    private:
        MemorySource& m_source;
        std::shared_ptr<const GameProfile> m_profile;
    };

}
