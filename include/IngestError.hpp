#pragma once

// Failure taxonomy of the ingestion pipeline. None of these terminate the process.
enum class IngestError {
    None = 0,
    InvalidPath,      // path rejected by validation, skip that root/file
    MalformedRecord,  // one line unusable, skip the line
    FileTooLarge,     // whole-file ceiling exceeded, skip the file
    ReadFailed,       // open/read error, skip the file
    WatchInitFailed,  // fall back to polling
    NoDataFound       // zero entries, report Inactive
};

inline const char* ingest_error_name(IngestError e) {
    switch (e) {
        case IngestError::None:            return "None";
        case IngestError::InvalidPath:     return "InvalidPath";
        case IngestError::MalformedRecord: return "MalformedRecord";
        case IngestError::FileTooLarge:    return "FileTooLarge";
        case IngestError::ReadFailed:      return "ReadFailed";
        case IngestError::WatchInitFailed: return "WatchInitFailed";
        case IngestError::NoDataFound:     return "NoDataFound";
    }
    return "Unknown";
}
