#include "server/internal/sessionHandler.hpp"
#include "networking/framing.hpp"
#include "networking/messageFormatting.hpp"

#include <algorithm>
#include <iostream>

namespace p2ps {

namespace {

ErrorCode sendFileList(FramedStream&      framed,
                       FileStore&         store,
                       const std::string& peer_label) {
    std::vector<std::string> names = store.listNames();
    std::cout << "[handleSession] Sending " << names.size()
              << " file name(s) to " << peer_label << std::endl;

    if (!framed.writeLine(std::to_string(names.size())))
        return ErrorCode::IO_ERROR;

    for (const std::string& f_name : names)
        if (!framed.writeLine(f_name))
            return ErrorCode::IO_ERROR;

    return ErrorCode::OK;
}

//reply with an ERROR: line, ErrorCode::OK if it went out
ErrorCode sendError(FramedStream& framed, const std::string& line) {
    return framed.writeLine(line) ? ErrorCode::OK : ErrorCode::IO_ERROR;
}

ErrorCode sendFile(FramedStream&      framed,
                   FileStore&         store,
                   const std::string& peer_label) {
    auto name_line = framed.readLine();
    //a half-closed peer can still read the reply
    std::string f_name = name_line ? trim(name_line.value()) : "";
    if (f_name.empty()) {
        std::cerr << "[handleSession] No file name provided by " << peer_label << std::endl;
        return sendError(framed, createNoFileNameError());
    }

    std::cout << "[handleSession] " << peer_label << " requested " << f_name << std::endl;

    //only names we'd list are served
    std::vector<std::string> names = store.listNames();
    if (std::find(names.begin(), names.end(), f_name) == names.end()) {
        std::cerr << "[handleSession] Requested file not found: " << f_name << std::endl;
        return sendError(framed, createNotFoundError(f_name));
    }

    //may still be gone by now
    ReadHandle handle;
    ErrorCode  open_res = store.openForRead(f_name, handle);
    if (open_res != ErrorCode::OK) {
        std::cerr << "[handleSession] Could not open " << f_name << ": "
                  << errorName(open_res) << std::endl;
        return sendError(framed, createNotFoundError(f_name));
    }

    if (!framed.writeLine(OK_RESPONSE))
        return ErrorCode::IO_ERROR;

    ErrorCode send_res = framed.writeLengthPrefixed(handle.size, *handle.source);
    if (send_res != ErrorCode::OK) {
        std::cerr << "[handleSession] Failed to send " << f_name << " to "
                  << peer_label << std::endl;
        return send_res;
    }

    std::cout << "[handleSession] Sent " << f_name << " (" << handle.size
              << " bytes) to " << peer_label << std::endl;
    return ErrorCode::OK;
}

ErrorCode serveRequest(FramedStream&      framed,
                       FileStore&         store,
                       const std::string& peer_label) {
    auto command = framed.readLine();
    if (!command) {
        //reachability checks connect and hang up, not an error
        std::cout << "[handleSession] No command received from " << peer_label << std::endl;
        return ErrorCode::OK;
    }

    if (isCommand(command.value(), LIST_FILES))
        return sendFileList(framed, store, peer_label);

    if (isCommand(command.value(), DOWNLOAD_FILE))
        return sendFile(framed, store, peer_label);

    std::cerr << "[handleSession] Unknown command received from " << peer_label
              << ": " << command.value() << std::endl;
    return sendError(framed, createUnknownCommandError(command.value()));
}

} //namespace

ErrorCode handleSession(ByteStream&        conn,
                        FileStore&         store,
                        const std::string& peer_label) {
    FramedStream framed(conn);
    ErrorCode    res = serveRequest(framed, store, peer_label);

    conn.close();
    std::cout << "[handleSession] Connection closed with " << peer_label << std::endl;
    return res;
}

} //p2ps
