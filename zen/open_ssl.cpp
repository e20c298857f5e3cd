// *****************************************************************************
// * This file is part of the Slate project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "open_ssl.h"
#include "thread.h"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/crypto.h>


using namespace zen;


namespace
{
#ifndef OPENSSL_THREADS
    #error OpenSSL built without thread support!
#endif

static_assert(OPENSSL_VERSION_NUMBER >= 0x30000000L, "OpenSSL version is too old!");


std::wstring formatOpenSSLError(const char* functionName, unsigned long ec)
{
    char errorBuf[256] = {}; //== buffer size used by ERR_error_string(); err.c: it seems the message uses at most ~200 bytes
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf)); //includes null-termination

    return formatSystemError(functionName, replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec)), utfTo<std::wstring>(errorBuf));
}


std::wstring formatLastOpenSSLError(const char* functionName)
{
    const auto ec = ::ERR_peek_last_error(); //"returns latest error code from the thread's error queue without modifying it" - unlike ERR_get_error()
    ::ERR_clear_error(); //clean up for next OpenSSL operation on this thread
    return formatOpenSSLError(functionName, ec);
}


//OpenSSL 1.1.0+ deprecates all clean up functions => per-thread state still needs explicit release
struct OpenSslThreadCleanUp
{
    ~OpenSslThreadCleanUp()
    {
        ::OPENSSL_thread_stop();
    }
};
thread_local OpenSslThreadCleanUp tearDownOpenSslThreadData;
}


void zen::openSslInit()
{
    assert(runningOnMainThread());
    //explicitly init OpenSSL on main thread: seems to initialize atomically! But it still might help to avoid issues
    if (::OPENSSL_init_crypto(OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError(_("Error during process initialization.") + L"\n\n" + formatLastOpenSSLError("OPENSSL_init_crypto"));
}


OpenSslDigest::OpenSslDigest(const char* algorithmName) //throw SysError
{
    [[maybe_unused]] const auto& dummy = tearDownOpenSslThreadData; //instantiate per-thread clean up for worker threads

    md_ = ::EVP_MD_fetch(nullptr /*libctx*/, algorithmName, nullptr /*properties*/);
    if (!md_)
        throw SysError(formatLastOpenSSLError("EVP_MD_fetch"));
    ZEN_ON_SCOPE_FAIL(::EVP_MD_free(md_));

    mdctx_ = ::EVP_MD_CTX_new();
    if (!mdctx_)
        throw SysError(formatSystemError("EVP_MD_CTX_new", L"", L"No more error details.")); //no more error details
    ZEN_ON_SCOPE_FAIL(::EVP_MD_CTX_free(mdctx_));

    if (::EVP_DigestInit_ex(mdctx_,          //EVP_MD_CTX* ctx
                            md_,             //const EVP_MD* type
                            nullptr) != 1)   //ENGINE* impl
        throw SysError(formatLastOpenSSLError("EVP_DigestInit_ex"));
}


OpenSslDigest::~OpenSslDigest()
{
    ::EVP_MD_CTX_free(mdctx_);
    ::EVP_MD_free(md_);
}


void OpenSslDigest::update(std::string_view bytes) //throw SysError
{
    if (::EVP_DigestUpdate(mdctx_,          //EVP_MD_CTX* ctx
                           bytes.data(),    //const void* d
                           bytes.size()) != 1) //size_t cnt
        throw SysError(formatLastOpenSSLError("EVP_DigestUpdate"));
}


std::string OpenSslDigest::finalize() //throw SysError
{
    std::string digest(EVP_MAX_MD_SIZE, '\0');
    unsigned int digestLen = 0;

    if (::EVP_DigestFinal_ex(mdctx_,                                            //EVP_MD_CTX* ctx
                             reinterpret_cast<unsigned char*>(digest.data()), //unsigned char* md
                             &digestLen) != 1)                                  //unsigned int* s
        throw SysError(formatLastOpenSSLError("EVP_DigestFinal_ex"));

    digest.resize(digestLen);
    return digest;
}
