#include "util/format.hpp"

static std::string_view StatusName(OsStatusId status) {
    switch (status) {
    case OsStatusSuccess: return "Success";
    case OsStatusOutOfMemory: return "OutOfMemory";
    case OsStatusNotFound: return "NotFound";
    case OsStatusInvalidInput: return "InvalidInput";
    case OsStatusNotSupported: return "NotSupported";
    case OsStatusAlreadyExists: return "AlreadyExists";
    case OsStatusInvalidType: return "InvalidType";
    case OsStatusInvalidData: return "InvalidData";
    case OsStatusTimeout: return "Timeout";
    case OsStatusOutOfBounds: return "OutOfBounds";
    case OsStatusInvalidAddress: return "InvalidAddress";
    case OsStatusInvalidSpan: return "InvalidSpan";
    case OsStatusDeviceFault: return "DeviceFault";
    case OsStatusDeviceBusy: return "DeviceBusy";
    case OsStatusDeviceNotReady: return "DeviceNotReady";
    case OsStatusCompleted: return "Completed";
    case OsStatusNotAvailable: return "NotAvailable";
    case OsStatusNotCalibrated: return "NotCalibrated";
    }

    return "Unknown";
}

void mr::Format<OsStatusId>::format(IOutStream& out, OsStatusId value) {
    out.format(mr::Hex(uint64_t(value)).pad(4), " (", StatusName(value), ")");
}
