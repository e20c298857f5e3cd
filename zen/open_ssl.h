// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef OPEN_SSL_H_801974580936508934568792347506
#define OPEN_SSL_H_801974580936508934568792347506

#include "sys_error.h"

struct evp_md_st;
struct evp_md_ctx_st;


namespace zen
{
//init OpenSSL before use!
void openSslInit();


//incremental message digest, e.g. "MD5", "SHA256"
class OpenSslDigest
{
public:
    explicit OpenSslDigest(const char* algorithmName); //throw SysError
    ~OpenSslDigest();

    void update(std::string_view bytes); //throw SysError
    std::string finalize(); //throw SysError; raw digest bytes, stream is unusable afterwards

private:
    OpenSslDigest           (const OpenSslDigest&) = delete;
    OpenSslDigest& operator=(const OpenSslDigest&) = delete;

    evp_md_st*     md_    = nullptr;
    evp_md_ctx_st* mdctx_ = nullptr;
};
}

#endif //OPEN_SSL_H_801974580936508934568792347506
