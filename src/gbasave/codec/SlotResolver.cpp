#include "gbasave/codec/SlotResolver.h"
#include "gbasave/common/Logger.h"

namespace GBASave::Codec {

    using Common::Logger;
    using Common::LogLevel;

    uint64_t SlotResolver::CounterSum(const std::vector<Sector>& sectors, uint32_t first, uint32_t count) {
        uint64_t sum = 0;
        for (const Sector& sector : sectors) {
            if (!sector.valid) continue;
            if (sector.index < first || sector.index >= first + count) continue;
            sum += sector.counter;
        }
        return sum;
    }

    SlotResolution SlotResolver::Resolve(const std::vector<Sector>& sectors, const GameProfile& profile,
                                         SlotPreference preference) {
        const SlotLayout& slots = profile.slots;
        SlotResolution result;
        result.sumA = CounterSum(sectors, slots.firstA, slots.countA);
        result.sumB = CounterSum(sectors, slots.firstB, slots.countB);

        switch (preference) {
            case SlotPreference::ForceA:
                result.range = SlotRange::A;
                result.forced = true;
                break;
            case SlotPreference::ForceB:
                result.range = SlotRange::B;
                result.forced = true;
                break;
            case SlotPreference::Auto:
                result.range = profile.activeSlot(result.sumA, result.sumB);
                break;
        }

        if (result.range == SlotRange::A) {
            result.baseIndex = slots.firstA;
            result.count = slots.countA;
        } else {
            result.baseIndex = slots.firstB;
            result.count = slots.countB;
        }

        Logger::Instance().LogFmt(LogLevel::Info, "SlotResolver", "%s: slot %s%s (sumA=%llu sumB=%llu)",
                                  profile.name.c_str(), result.range == SlotRange::A ? "A" : "B",
                                  result.forced ? " (forced)" : "",
                                  static_cast<unsigned long long>(result.sumA),
                                  static_cast<unsigned long long>(result.sumB));
        return result;
    }

}
