#include <marklex/scan/scan_issue.h>

namespace marklex::scan {

const char* scanner_error_code_name(ScannerErrorCode code) {
    switch (code) {
        case ScannerErrorCode::UnterminatedComment:               return "UnterminatedComment";
        case ScannerErrorCode::UnterminatedCDATA:                 return "UnterminatedCDATA";
        case ScannerErrorCode::UnterminatedDoctype:               return "UnterminatedDoctype";
        case ScannerErrorCode::UnterminatedProcessingInstruction: return "UnterminatedProcessingInstruction";
        case ScannerErrorCode::UnterminatedRawText:               return "UnterminatedRawText";
        case ScannerErrorCode::UnterminatedFence:                 return "UnterminatedFence";
        case ScannerErrorCode::UnknownEntity:                     return "UnknownEntity";
        case ScannerErrorCode::InvalidHtmlAttribute:              return "InvalidHtmlAttribute";
        case ScannerErrorCode::UnterminatedHtmlAttributeValue:    return "UnterminatedHtmlAttributeValue";
    }
    return "Unknown";
}

const char* scan_stage_name(ScanStage stage) {
    return stage == ScanStage::Phase1 ? "phase1" : "phase2";
}

const char* scanner_error_message(ScannerErrorCode code) {
    switch (code) {
        case ScannerErrorCode::UnterminatedComment:
            return "HTML comment is not closed before the end of input";
        case ScannerErrorCode::UnterminatedCDATA:
            return "CDATA section is not closed before the end of input";
        case ScannerErrorCode::UnterminatedDoctype:
            return "declaration is not closed before the end of input";
        case ScannerErrorCode::UnterminatedProcessingInstruction:
            return "processing instruction is not closed before the end of input";
        case ScannerErrorCode::UnterminatedRawText:
            return "raw text element has no end tag";
        case ScannerErrorCode::UnterminatedFence:
            return "fenced block has no closing fence";
        case ScannerErrorCode::UnknownEntity:
            return "unknown named character reference kept verbatim";
        case ScannerErrorCode::InvalidHtmlAttribute:
            return "attribute has '=' but no value";
        case ScannerErrorCode::UnterminatedHtmlAttributeValue:
            return "quoted attribute value is not closed";
    }
    return "scanner issue";
}

} // namespace marklex::scan
