#include "gbasave/codec/ProfileDetector.h"
#include "gbasave/codec/SaveDocument.h"
#include "gbasave/codec/SectorStore.h"
#include "gbasave/common/Logger.h"

namespace GBASave::Codec {

    using Common::Logger;
    using Common::LogLevel;

    namespace {
        constexpr const char* kLogCategory = "ProfileDetector";
    }

    bool ProfileDetector::Accepts(const std::vector<uint8_t>& image, const GameProfile& profile,
                                  const ParseOptions& options) {
        Logger& log = Logger::Instance();
        if (!SectorStore::HasSignature(image, profile)) {
            log.LogFmt(LogLevel::Info, kLogCategory, "%s: signature 0x%08X not found", profile.name.c_str(),
                       profile.geometry.signature);
            return false;
        }

        SaveDocument doc;
        if (SaveDocument::Load(image, profile, doc, options) != SaveStatus::Ok) return false;
        if (doc.Roster().empty()) {
            log.LogFmt(LogLevel::Info, kLogCategory, "%s: no decodable roster (%s)", profile.name.c_str(),
                       RosterStopReasonName(doc.RosterStop()));
            return false;
        }

        log.LogFmt(LogLevel::Info, kLogCategory, "%s: accepted with %zu roster records", profile.name.c_str(),
                   doc.Roster().size());
        return true;
    }

    SaveStatus ProfileDetector::Detect(const std::vector<uint8_t>& image, const std::vector<GameProfile>& profiles,
                                       const GameProfile*& out) {
        return Detect(image, profiles, out, ParseOptions());
    }

    SaveStatus ProfileDetector::Detect(const std::vector<uint8_t>& image, const std::vector<GameProfile>& profiles,
                                       const GameProfile*& out, const ParseOptions& options) {
        out = nullptr;
        if (image.empty()) return SaveStatus::MalformedInput;
        if (profiles.empty()) return SaveStatus::UnsupportedGame;

        bool anySizeFits = false;
        for (const GameProfile& profile : profiles) {
            if (SaveDocument::CheckImageSize(image, profile) != SaveStatus::Ok) continue;
            anySizeFits = true;
            if (Accepts(image, profile, options)) {
                out = &profile;
                return SaveStatus::Ok;
            }
        }

        if (!anySizeFits) {
            Logger::Instance().LogFmt(LogLevel::Error, kLogCategory, "%zu-byte image fits no profile geometry",
                                      image.size());
            return SaveStatus::MalformedInput;
        }
        Logger::Instance().Log(LogLevel::Error, kLogCategory, "no profile accepted the image");
        return SaveStatus::UnsupportedGame;
    }

}
