#pragma once
#include <cstddef>
#include <cstdint>

namespace marklex::scan {

// Codes attached to diagnostics. Reporting never changes the token stream.
enum class ScannerErrorCode : uint32_t {
    UnterminatedComment = 1,
    UnterminatedCDATA = 2,
    UnterminatedDoctype = 3,
    UnterminatedProcessingInstruction = 4,
    UnterminatedRawText = 5,
    UnterminatedFence = 6,
    UnknownEntity = 7,
    InvalidHtmlAttribute = 8,
    UnterminatedHtmlAttributeValue = 9,
};

enum class ScanStage : uint8_t {
    Phase1,
    Phase2,
};

struct ScanIssue {
    ScannerErrorCode code = ScannerErrorCode::UnterminatedComment;
    ScanStage stage = ScanStage::Phase1;
    size_t start = 0;
    size_t end = 0;

    bool same_report(const ScanIssue& other) const {
        return code == other.code && start == other.start && end == other.end;
    }
};

const char* scanner_error_code_name(ScannerErrorCode code);
const char* scan_stage_name(ScanStage stage);

// Human readable description used as the diagnostic message.
const char* scanner_error_message(ScannerErrorCode code);

} // namespace marklex::scan
