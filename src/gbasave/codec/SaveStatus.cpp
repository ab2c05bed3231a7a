#include "gbasave/codec/SaveStatus.h"

namespace GBASave::Codec {

    const char* StatusName(SaveStatus status) {
        switch (status) {
            case SaveStatus::Ok: return "Ok";
            case SaveStatus::MalformedInput: return "MalformedInput";
            case SaveStatus::UnsupportedGame: return "UnsupportedGame";
            case SaveStatus::RosterTooLong: return "RosterTooLong";
            case SaveStatus::MissingSector: return "MissingSector";
            case SaveStatus::RecordSizeMismatch: return "RecordSizeMismatch";
            case SaveStatus::InvalidArgument: return "InvalidArgument";
            case SaveStatus::InvalidPartyCount: return "InvalidPartyCount";
            case SaveStatus::SourceReadFailed: return "SourceReadFailed";
            case SaveStatus::SourceWriteFailed: return "SourceWriteFailed";
        }
        return "Unknown";
    }

}
