#pragma once

namespace GBASave::Codec {

    // Result of every fallible codec operation. Nothing in the codec throws.
    enum class SaveStatus {
        Ok,
        MalformedInput,     // empty buffer, too small, or not a whole number of sectors
        UnsupportedGame,    // no profile accepted the image
        RosterTooLong,      // more records than the profile's party size
        MissingSector,      // a sector needed for write-back is not valid in the active slot
        RecordSizeMismatch, // record does not belong to this profile/kind
        InvalidArgument,
        InvalidPartyCount,
        SourceReadFailed,
        SourceWriteFailed
    };

    const char* StatusName(SaveStatus status);

}
