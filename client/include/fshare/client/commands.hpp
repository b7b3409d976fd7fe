#pragma once

#include <ostream>

#include "fshare/client/client.hpp"
#include "fshare/client/config.hpp"
#include "fshare/http.hpp"

namespace fshare::client
{

    /**
     * Logs in and runs config.command ("upload" or "download") over `transport`.
     *
     * Results (locations, the uploaded file URL, downloaded bytes without -o) go
     * to `out`; failure lines go to `err`. Returns the process exit code.
     * Usage and I/O problems throw fshare::Error.
     */
    int run_command(const ClientConfig &config, HttpTransport &transport, std::ostream &out, std::ostream &err);

    int run_download(Client &client, const ClientConfig &config, RedirectMode redirect, std::ostream &out,
                     std::ostream &err);

    int run_upload(Client &client, const ClientConfig &config, RedirectMode redirect, std::ostream &out,
                   std::ostream &err);

} // namespace fshare::client
