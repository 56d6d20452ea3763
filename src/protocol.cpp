#include "protocol.hpp"

namespace xgear {
auto command_name(const Command command) -> const char* {
    switch(command) {
    case Command::CAN_DO:
        return "CAN_DO";
    case Command::CANT_DO:
        return "CANT_DO";
    case Command::RESET_ABILITIES:
        return "RESET_ABILITIES";
    case Command::PRE_SLEEP:
        return "PRE_SLEEP";
    case Command::NOOP:
        return "NOOP";
    case Command::SUBMIT_JOB:
        return "SUBMIT_JOB";
    case Command::JOB_CREATED:
        return "JOB_CREATED";
    case Command::GRAB_JOB:
        return "GRAB_JOB";
    case Command::NO_JOB:
        return "NO_JOB";
    case Command::JOB_ASSIGN:
        return "JOB_ASSIGN";
    case Command::WORK_STATUS:
        return "WORK_STATUS";
    case Command::WORK_COMPLETE:
        return "WORK_COMPLETE";
    case Command::WORK_FAIL:
        return "WORK_FAIL";
    case Command::GET_STATUS:
        return "GET_STATUS";
    case Command::ECHO_REQ:
        return "ECHO_REQ";
    case Command::ECHO_RES:
        return "ECHO_RES";
    case Command::SUBMIT_JOB_BG:
        return "SUBMIT_JOB_BG";
    case Command::ERROR:
        return "ERROR";
    case Command::STATUS_RES:
        return "STATUS_RES";
    case Command::SUBMIT_JOB_HIGH:
        return "SUBMIT_JOB_HIGH";
    case Command::SET_CLIENT_ID:
        return "SET_CLIENT_ID";
    case Command::CAN_DO_TIMEOUT:
        return "CAN_DO_TIMEOUT";
    case Command::ALL_YOURS:
        return "ALL_YOURS";
    case Command::WORK_EXCEPTION:
        return "WORK_EXCEPTION";
    case Command::OPTION_REQ:
        return "OPTION_REQ";
    case Command::OPTION_RES:
        return "OPTION_RES";
    case Command::WORK_DATA:
        return "WORK_DATA";
    case Command::WORK_WARNING:
        return "WORK_WARNING";
    case Command::GRAB_JOB_UNIQ:
        return "GRAB_JOB_UNIQ";
    case Command::JOB_ASSIGN_UNIQ:
        return "JOB_ASSIGN_UNIQ";
    case Command::SUBMIT_JOB_HIGH_BG:
        return "SUBMIT_JOB_HIGH_BG";
    case Command::SUBMIT_JOB_LOW:
        return "SUBMIT_JOB_LOW";
    case Command::SUBMIT_JOB_LOW_BG:
        return "SUBMIT_JOB_LOW_BG";
    }
    return "UNKNOWN";
}
} // namespace xgear
