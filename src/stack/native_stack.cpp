#include <tunstack/stack/native_stack.h>

namespace tunstack {
namespace core {
namespace stack {

std::string to_string(StackErr err) {
    switch (err) {
        case StackErr::OK: return "OK";
        case StackErr::MEM: return "MEM";
        case StackErr::BUF: return "BUF";
        case StackErr::TIMEOUT: return "TIMEOUT";
        case StackErr::RTE: return "RTE";
        case StackErr::INPROGRESS: return "INPROGRESS";
        case StackErr::VAL: return "VAL";
        case StackErr::WOULDBLOCK: return "WOULDBLOCK";
        case StackErr::USE: return "USE";
        case StackErr::ALREADY: return "ALREADY";
        case StackErr::ISCONN: return "ISCONN";
        case StackErr::CONN: return "CONN";
        case StackErr::IF: return "IF";
        case StackErr::ABRT: return "ABRT";
        case StackErr::RST: return "RST";
        case StackErr::CLSD: return "CLSD";
        case StackErr::ARG: return "ARG";
        default: return "UNKNOWN(" + std::to_string(static_cast<int>(err)) + ")";
    }
}

} // namespace stack
} // namespace core
} // namespace tunstack
