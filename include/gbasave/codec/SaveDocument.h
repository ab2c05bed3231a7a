#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "gbasave/common/Loggable.h"
#include "gbasave/codec/BlockAssembler.h"
#include "gbasave/codec/CreatureRecord.h"
#include "gbasave/codec/GameProfile.h"
#include "gbasave/codec/SaveStatus.h"
#include "gbasave/codec/SectorStore.h"
#include "gbasave/codec/SlotResolver.h"

namespace GBASave::Codec {

    struct ParseOptions {
        SlotPreference slot = SlotPreference::Auto;
    };

    struct PlayTime {
        uint16_t hours = 0;
        uint8_t minutes = 0;
        uint8_t seconds = 0;
    };

    // Why roster enumeration ended.
    enum class RosterStopReason {
        Exhausted,          // every party slot held a record
        EmptySlot,          // species 0 sentinel
        NoData              // no roster sector in the active slot
    };

    const char* RosterStopReasonName(RosterStopReason reason);

    /**
     * A decoded save image: the sector table, the active slot, the trainer
     * and roster blocks, and the ordered roster.
     *
     * The document keeps its own copy of the image. Roster records are
     * mutable in place; Reconstruct() splices them into a fresh copy of the
     * image and never modifies the one the document was loaded from.
     */
    class SaveDocument : public Common::Loggable {
    public:
        SaveDocument();

        static SaveStatus Load(const std::vector<uint8_t>& image, const GameProfile& profile, SaveDocument& out,
                               const ParseOptions& options = ParseOptions());

        // Detects the profile from an ordered candidate list, then loads with it.
        static SaveStatus LoadDetect(const std::vector<uint8_t>& image, const std::vector<GameProfile>& profiles,
                                     SaveDocument& out, const ParseOptions& options = ParseOptions());

        // Validates an image's size against a profile's geometry.
        static SaveStatus CheckImageSize(const std::vector<uint8_t>& image, const GameProfile& profile);

        const GameProfile& Profile() const { return *m_profile; }
        const std::vector<uint8_t>& Image() const { return m_image; }
        const std::vector<Sector>& Sectors() const { return m_sectors; }
        const SlotResolution& Slot() const { return m_slot; }
        const SectorMap& Mapping() const { return m_map; }
        const std::vector<uint8_t>& TrainerBlock() const { return m_trainerBlock; }
        const std::vector<uint8_t>& RosterBlock() const { return m_rosterBlock; }

        std::string PlayerName() const;
        PlayTime GetPlayTime() const;
        uint32_t StoredPartyCount() const;

        const std::vector<CreatureRecord>& Roster() const { return m_roster; }
        CreatureRecord* Member(size_t index);
        RosterStopReason RosterStop() const { return m_stop; }

        // Writes the current roster back into a copy of the loaded image.
        SaveStatus Reconstruct(std::vector<uint8_t>& out) const;

        // Writes a roster into a copy of baseImage, resolving the slot afresh.
        static SaveStatus Reconstruct(const std::vector<uint8_t>& baseImage, const std::vector<CreatureRecord>& roster,
                                      const GameProfile& profile, std::vector<uint8_t>& out,
                                      const ParseOptions& options = ParseOptions());

    private:
        static SaveStatus Patch(const std::vector<uint8_t>& baseImage, const SectorMap& map,
                                const std::vector<CreatureRecord>& roster, const GameProfile& profile,
                                std::vector<uint8_t>& out);

        void ReadRoster();

        std::shared_ptr<const GameProfile> m_profile;
        std::vector<uint8_t> m_image;
        std::vector<Sector> m_sectors;
        SlotResolution m_slot;
        SectorMap m_map;
        std::vector<uint8_t> m_trainerBlock;
        std::vector<uint8_t> m_rosterBlock;
        std::vector<CreatureRecord> m_roster;
        RosterStopReason m_stop = RosterStopReason::NoData;
    };

}
