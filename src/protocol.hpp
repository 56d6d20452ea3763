#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

namespace xgear {
/*
    Packet between job server and client/worker

    # header
        4 bytes: magic, "\0REQ" (to server) or "\0RES" (from server)
        uint32_t(big endian): command
        uint32_t(big endian): payload length

    # payload
        fields separated by '\0'
        the last field is never split, it may contain '\0'

    # worker
        CAN_DO         w -> s : function name
        CANT_DO        w -> s : function name
        SET_CLIENT_ID  w -> s : id
        GRAB_JOB       w -> s : none
        NO_JOB         w <- s : none
        JOB_ASSIGN     w <- s : handle, function, data
        PRE_SLEEP      w -> s : none
        NOOP           w <- s : none (wake up)
        WORK_DATA      w -> s : handle, data
        WORK_WARNING   w -> s : handle, data
        WORK_STATUS    w -> s : handle, numerator, denominator
        WORK_COMPLETE  w -> s : handle, result
        WORK_EXCEPTION w -> s : handle, error text
        WORK_FAIL      w -> s : handle

    # client
        SUBMIT_JOB(_HIGH|_LOW)(_BG) c -> s : function, unique id, data
        JOB_CREATED                 c <- s : handle
        GET_STATUS                  c -> s : handle
        STATUS_RES                  c <- s : handle, known, running, numerator, denominator
        WORK_*                      c <- s : same as worker -> server

    # both
        ECHO_REQ c -> s : data
        ECHO_RES c <- s : data
        ERROR    c <- s : code, text
 */
enum class Command : uint32_t {
    CAN_DO             = 1,
    CANT_DO            = 2,
    RESET_ABILITIES    = 3,
    PRE_SLEEP          = 4,
    NOOP               = 6,
    SUBMIT_JOB         = 7,
    JOB_CREATED        = 8,
    GRAB_JOB           = 9,
    NO_JOB             = 10,
    JOB_ASSIGN         = 11,
    WORK_STATUS        = 12,
    WORK_COMPLETE      = 13,
    WORK_FAIL          = 14,
    GET_STATUS         = 15,
    ECHO_REQ           = 16,
    ECHO_RES           = 17,
    SUBMIT_JOB_BG      = 18,
    ERROR              = 19,
    STATUS_RES         = 20,
    SUBMIT_JOB_HIGH    = 21,
    SET_CLIENT_ID      = 22,
    CAN_DO_TIMEOUT     = 23,
    ALL_YOURS          = 24,
    WORK_EXCEPTION     = 25,
    OPTION_REQ         = 26,
    OPTION_RES         = 27,
    WORK_DATA          = 28,
    WORK_WARNING       = 29,
    GRAB_JOB_UNIQ      = 30,
    JOB_ASSIGN_UNIQ    = 31,
    SUBMIT_JOB_HIGH_BG = 32,
    SUBMIT_JOB_LOW     = 33,
    SUBMIT_JOB_LOW_BG  = 34,
};

enum class Magic {
    REQUEST,
    RESPONSE,
};

using MagicBytes = std::array<uint8_t, 4>;

constexpr MagicBytes REQUEST_MAGIC  = {'\0', 'R', 'E', 'Q'};
constexpr MagicBytes RESPONSE_MAGIC = {'\0', 'R', 'E', 'S'};
constexpr size_t     HEADER_LEN     = 12;
constexpr uint16_t   DEFAULT_PORT   = 4730;

auto command_name(Command command) -> const char*;
} // namespace xgear
