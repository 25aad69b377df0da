// *****************************************************************************
// * This file is part of the SftpMirror project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) SftpMirror developers - All Rights Reserved                 *
// *****************************************************************************

#include "sftp.h"
#include <cassert>
#include <cstring>
#include <exception>
#include <optional>
#include <set>
#include <sfm/extra_log.h>
#include <sfm/file_path.h>
#include <sfm/socket.h>
#include <sfm/thread.h>
#include <libssh2/libssh2_wrap.h>
#include <poll.h>

using namespace sfm;
using namespace mirror;


namespace
{
constexpr std::chrono::seconds SFTP_SESSION_MAX_IDLE_TIME(20);

//pending I/O is polled in slices: a stop request must not wait for the network time-out
constexpr std::chrono::milliseconds SFTP_WAIT_SLICE(100);

//=> most likely *not* a connection issue
struct SysErrorSftpProtocol : public SysError
{
    SysErrorSftpProtocol(const std::wstring& msg, unsigned long sftpError) : SysError(msg), sftpErrorCode(sftpError) {}

    const unsigned long sftpErrorCode;
};

DEFINE_NEW_SYS_ERROR(SysErrorPassword)


std::wstring getSftpDisplayPath(const SftpLogin& login, const Zstring& itemPath)
{
    Zstring displayPath = Zstr("sftp://") + login.server;

    if (login.port != DEFAULT_PORT_SFTP)
        displayPath += Zstr(':') + numberTo<Zstring>(login.port);

    if (!startsWith(itemPath, FILE_NAME_SEPARATOR))
        displayPath += FILE_NAME_SEPARATOR;

    return utfTo<std::wstring>(displayPath + itemPath);
}


struct KbdInteractiveState
{
    const std::string& passwordUtf8;
    std::wstring unexpectedPrompts;
    std::exception_ptr error; //exceptions must not pass through libssh2
};


//a single prompt without echo is the password request; the prompt text itself may be localized
void answerKbdInteractive(const char* /*name*/, int /*nameLen*/, const char* /*instruction*/, int /*instructionLen*/, int promptCount,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts, LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses, void** abstract)
{
    auto& state = *static_cast<KbdInteractiveState*>(*abstract);
    try
    {
        if (promptCount == 1 && prompts[0].echo == 0)
        {
            responses[0].text = ::strdup(state.passwordUtf8.c_str()); //libssh2 takes ownership and calls free()
            responses[0].length = static_cast<unsigned int>(state.passwordUtf8.size());
            return;
        }
        for (int i = 0; i < promptCount; ++i)
        {
            if (!state.unexpectedPrompts.empty())
                state.unexpectedPrompts += L'|';
            state.unexpectedPrompts += utfTo<std::wstring>(std::string_view(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length));
        }
    }
    catch (...) { state.error = std::current_exception(); } //rethrown once libssh2 returns
}


class SshSession
{
public:
    explicit SshSession(const SftpLogin& login) : //throw SysError, SysErrorPassword
        timeoutSec_(login.timeoutSec),
        serverName_(utfTo<std::wstring>(login.server))
    {
        SFM_ON_SCOPE_FAIL(cleanup()); //destructor call would lead to member double clean-up!!!

        socket_.emplace(login.server, numberTo<Zstring>(login.port), timeoutSec_); //throw SysError

        sshSession_ = ::libssh2_session_init();
        if (!sshSession_) //does not set ssh last error; source: only memory allocation may fail
            throw SysError(formatSystemError("libssh2_session_init", formatSshStatusCode(LIBSSH2_ERROR_ALLOC), L""));

        ::libssh2_session_set_blocking(sshSession_, 1);
        ::libssh2_session_set_timeout(sshSession_, timeoutSec_ * 1000 /*ms*/);

        if (::libssh2_session_handshake(sshSession_, socket_->get()) != 0)
            throw SysError(formatLastSshError("libssh2_session_handshake"));

        //host key is accepted as is: no known_hosts check

        authenticate(utfTo<std::string>(login.username), utfTo<std::string>(login.password)); //throw SysError, SysErrorPassword

        sftpChannel_ = ::libssh2_sftp_init(sshSession_);
        if (!sftpChannel_)
            throw SysError(formatLastSshError("libssh2_sftp_init"));

        lastSuccessfulUseTime_ = std::chrono::steady_clock::now();
    }

    ~SshSession() { cleanup(); }

    bool isHealthy() const
    {
        if (commandPending_ || possiblyCorrupted_)
            return false;

        if (std::chrono::steady_clock::now() > lastSuccessfulUseTime_ + SFTP_SESSION_MAX_IDLE_TIME)
            return false;

        return true;
    }

    void markAsCorrupted() { possiblyCorrupted_ = true; }

    //context: any thread; the owning thread's pending and future I/O fails immediately
    void abortIo() //noexcept
    {
        possiblyCorrupted_ = true;
        try
        {
            shutdownSocketBoth(socket_->get()); //throw SysError
        }
        catch (const SysError& e) { logExtraError(replaceCpy(_("Cannot abort connection to %x."), L"%x", fmtPath(serverName_)) + L"\n\n" + e.toString()); }
    }

    struct Details
    {
        LIBSSH2_SESSION* sshSession;
        LIBSSH2_SFTP*   sftpChannel;
    };

    //run sftpCommand until it no longer reports LIBSSH2_ERROR_EAGAIN
    void executeBlocking(const char* functionName, const std::function<int(const Details& sd)>& sftpCommand /*noexcept!*/,
                         bool interruptible = true) //throw SysError, SysErrorSftpProtocol, ThreadStopRequest
    {
        ::libssh2_session_set_blocking(sshSession_, 0);
        SFM_ON_SCOPE_EXIT(::libssh2_session_set_blocking(sshSession_, 1));

        const auto commandStartTime = std::chrono::steady_clock::now();
        commandPending_ = true; //reset only on completion: an exception leaves the session unusable

        for (;;)
        {
            const int rc = sftpCommand({sshSession_, sftpChannel_}); //noexcept

            if (rc < 0 && ::libssh2_session_last_errno(sshSession_) != rc) //when libssh2 fails to properly set last error
                ::libssh2_session_set_last_error(sshSession_, rc, nullptr);

            if (rc >= LIBSSH2_ERROR_NONE ||
                (rc == LIBSSH2_ERROR_SFTP_PROTOCOL && ::libssh2_sftp_last_error(sftpChannel_) != LIBSSH2_FX_OK))
                //LIBSSH2_ERROR_SFTP_PROTOCOL *without* LIBSSH2_SFTP::last_errno indicates a corrupted connection!
            {
                commandPending_ = false;
                lastSuccessfulUseTime_ = std::chrono::steady_clock::now(); //SFTP status errors leave the SSH session intact

                if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL)
                    throw SysErrorSftpProtocol(formatLastSshError(functionName), ::libssh2_sftp_last_error(sftpChannel_));
                return;
            }

            if (rc != LIBSSH2_ERROR_EAGAIN) //=> SSH session errors only, e.g. LIBSSH2_ERROR_SOCKET_RECV
                throw SysError(formatLastSshError(functionName));

            const auto stopTime = commandStartTime + std::chrono::seconds(timeoutSec_);
            const auto now = std::chrono::steady_clock::now();
            if (now >= stopTime)
                throw SysError(formatSystemError(functionName, formatSshStatusCode(LIBSSH2_ERROR_TIMEOUT),
                                                 _P("Operation timed out after 1 second.", "Operation timed out after %x seconds.", timeoutSec_)));

            waitForTraffic(std::min(std::chrono::duration_cast<std::chrono::milliseconds>(stopTime - now) + std::chrono::milliseconds(1),
                                    SFTP_WAIT_SLICE)); //throw SysError
            if (interruptible)
                interruptionPoint(); //throw ThreadStopRequest
        }
    }

private:
    SshSession           (const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    void authenticate(const std::string& usernameUtf8, const std::string& passwordUtf8) //throw SysError, SysErrorPassword
    {
        const char* authList = sshUserAuthList(sshSession_, usernameUtf8);
        if (!authList)
        {
            if (::libssh2_userauth_authenticated(sshSession_) != 1)
                throw SysError(formatLastSshError("libssh2_userauth_list"));
            return; //SSH_USERAUTH_NONE has authenticated successfully => we're already done
        }

        bool supportAuthPassword    = false;
        bool supportAuthInteractive = false;
        for (const std::string& authMethod : splitCpy(std::string(authList), ',', SplitOnEmpty::skip))
        {
            const std::string method = trimCpy(authMethod);
            if (method == "password")
                supportAuthPassword = true;
            else if (method == "keyboard-interactive")
                supportAuthInteractive = true;
        }

        if (supportAuthPassword)
        {
            if (sshUserAuthPassword(sshSession_, usernameUtf8, passwordUtf8) != 0)
                throw SysErrorPassword(formatLastSshError("libssh2_userauth_password"));
        }
        else if (supportAuthInteractive) //some servers support "keyboard-interactive", but not "password"
        {
            KbdInteractiveState state{passwordUtf8, {}, nullptr};

            void** abstract = ::libssh2_session_abstract(sshSession_);
            if (*abstract)
                throw SysError(L"libssh2_session_abstract: non-null value");

            *abstract = &state;
            SFM_ON_SCOPE_EXIT(*abstract = nullptr);

            const int rc = sshUserAuthKeyboardInteractive(sshSession_, usernameUtf8, answerKbdInteractive);

            if (state.error)
                std::rethrow_exception(state.error);

            if (rc != 0)
                throw SysErrorPassword(formatLastSshError("libssh2_userauth_keyboard_interactive") +
                                       (state.unexpectedPrompts.empty() ? L"" : L"\nUnexpected prompts: " + state.unexpectedPrompts));
        }
        else
            throw SysError(replaceCpy(_("The server does not support authentication via %x."), L"%x", L"\"username/password\"") +
                           L'\n' + _("Required:") + L' ' + utfTo<std::wstring>(std::string_view(authList)));
    }

    //returns when traffic is available or the wait slice is over: both cases are handled by the next attempt
    void waitForTraffic(std::chrono::milliseconds maxWait) //throw SysError
    {
        //reference: libssh2 session.c: _libssh2_wait_socket()
        pollfd pfd{.fd = socket_->get()};

        const int dir = ::libssh2_session_block_directions(sshSession_);
        if (dir & LIBSSH2_SESSION_BLOCK_INBOUND)
            pfd.events |= POLLIN;
        if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND)
            pfd.events |= POLLOUT;

        if (pfd.events == 0) //nothing to wait for
            return;

        const int rv = ::poll(&pfd, 1, static_cast<int>(maxWait.count()));
        if (rv < 0 && errno != EINTR)
            THROW_LAST_SYS_ERROR("poll");
        //rv == 0: time-out => let next attempt decide
    }

    void cleanup() //attention: may block heavily after error!
    {
        if (sftpChannel_)
            if (::libssh2_sftp_shutdown(sftpChannel_) != LIBSSH2_ERROR_NONE)
                assert(possiblyCorrupted_ || commandPending_);

        if (sshSession_)
        {
            if (!commandPending_ && !possiblyCorrupted_)
                if (::libssh2_session_disconnect(sshSession_, "SftpMirror says \"bye\"!") != LIBSSH2_ERROR_NONE) //= server notification only!
                    assert(false);
            //else: avoid further stress on the broken SSH session and take French leave

            if (::libssh2_session_free(sshSession_) != LIBSSH2_ERROR_NONE)
                assert(false);
        }
    }

    std::wstring formatLastSshError(const char* functionName) const
    {
        char* lastErrorMsg = nullptr; //owned by "sshSession"
        const int sshStatusCode = ::libssh2_session_last_error(sshSession_, &lastErrorMsg, nullptr, false /*want_buf*/);

        std::wstring errorMsg;
        if (lastErrorMsg)
            errorMsg = trimCpy(utfTo<std::wstring>(std::string_view(lastErrorMsg)));

        //LIBSSH2_ERROR_SFTP_PROTOCOL does *not* mean libssh2_sftp_last_error() is also available!
        if (sshStatusCode == LIBSSH2_ERROR_SFTP_PROTOCOL && sftpChannel_ && ::libssh2_sftp_last_error(sftpChannel_) != LIBSSH2_FX_OK)
        {
            if (errorMsg == L"SFTP Protocol Error") //that's trite!
                errorMsg.clear();
            return formatSystemError(functionName, formatSftpStatusCode(::libssh2_sftp_last_error(sftpChannel_)), errorMsg);
        }

        return formatSystemError(functionName, formatSshStatusCode(sshStatusCode), errorMsg);
    }

    const int timeoutSec_;
    const std::wstring serverName_;
    std::optional<Socket> socket_; //*bound* after constructor has run
    LIBSSH2_SESSION* sshSession_ = nullptr;
    LIBSSH2_SFTP* sftpChannel_ = nullptr;

    bool commandPending_ = false;
    std::atomic<bool> possiblyCorrupted_{false}; //written by abortIo() from any thread
    std::chrono::steady_clock::time_point lastSuccessfulUseTime_;
};

//===========================================================================================================================

class SftpSessionPool //reuse (healthy) SFTP sessions across threads
{
public:
    explicit SftpSessionPool(const SftpLogin& login) : login_(login) {}

    ~SftpSessionPool() { assert(sessions_.access([](const Sessions& s) { return s.active.empty(); })); }

    struct ReUseOnDelete
    {
        SftpSessionPool* pool = nullptr;
        void operator()(SshSession* s) const { pool->returnSession(s); }
    };
    using SessionPtr = std::unique_ptr<SshSession, ReUseOnDelete>;

    SessionPtr getSession() //throw SysError
    {
        std::vector<std::unique_ptr<SshSession>> expiredSessions; //clean up *outside* the lock: may block
        std::unique_ptr<SshSession> session = sessions_.access([&](Sessions& s) -> std::unique_ptr<SshSession>
        {
            while (!s.idle.empty()) //most recently used first: least likely timed out by the server
            {
                std::unique_ptr<SshSession> idleSession = std::move(s.idle.back());
                s.idle.pop_back();

                if (idleSession->isHealthy())
                {
                    s.active.insert(idleSession.get());
                    return idleSession;
                }
                expiredSessions.push_back(std::move(idleSession));
            }
            return nullptr;
        });

        if (!session)
            try
            {
                session = std::make_unique<SshSession>(login_); //throw SysError, SysErrorPassword
                sessions_.access([&](Sessions& s) { s.active.insert(session.get()); });
            }
            catch (const SysErrorPassword& e)
            {
                throw SysError(_("Authentication failed.") + L' ' + e.toString());
            }

        return SessionPtr(session.release(), ReUseOnDelete{this});
    }

    void abortPendingIo() //noexcept
    {
        sessions_.access([](Sessions& s)
        {
            for (SshSession* session : s.active)
                session->abortIo(); //noexcept
        });
    }

    const SftpLogin& getLogin() const { return login_; }

private:
    SftpSessionPool           (const SftpSessionPool&) = delete;
    SftpSessionPool& operator=(const SftpSessionPool&) = delete;

    void returnSession(SshSession* session) //noexcept
    {
        std::unique_ptr<SshSession> sessionOwned(session);
        sessions_.access([&](Sessions& s)
        {
            s.active.erase(session);
            if (session->isHealthy())
                s.idle.push_back(std::move(sessionOwned));
        });
        //unhealthy session: destroyed outside the lock
    }

    struct Sessions
    {
        std::vector<std::unique_ptr<SshSession>> idle;
        std::set<SshSession*> active; //abortPendingIo() needs access to sessions in use
    };

    const SftpLogin login_;
    Protected<Sessions> sessions_;
};

//===========================================================================================================================

//close without throwing: runs during stack unwinding, too
void closeHandle(SshSession& session, LIBSSH2_SFTP_HANDLE* handle, const std::wstring& displayPath) //noexcept
{
    if (!session.isHealthy()) //e.g. aborted mid-command: session will be discarded => handle goes with it
    {
        session.markAsCorrupted();
        return;
    }

    try
    {
        session.executeBlocking("libssh2_sftp_close", //throw SysError, SysErrorSftpProtocol
        [&](const SshSession::Details& sd) { return ::libssh2_sftp_close(handle); }, false /*interruptible*/); //noexcept!
    }
    catch (const SysError& e) { logExtraError(replaceCpy(_("Cannot close handle of %x."), L"%x", fmtPath(displayPath)) + L"\n\n" + e.toString()); }
}


class InputStreamSftp : public RemoteFileSystem::InputStream
{
public:
    InputStreamSftp(SftpSessionPool& pool, const Zstring& filePath, uint64_t startOffset) : //throw FileError
        displayPath_(getSftpDisplayPath(pool.getLogin(), filePath))
    {
        try
        {
            session_ = pool.getSession(); //throw SysError

            session_->executeBlocking("libssh2_sftp_open", //throw SysError, SysErrorSftpProtocol, ThreadStopRequest
                                      [&](const SshSession::Details& sd) //noexcept!
            {
                fileHandle_ = sftpOpenFile(sd.sftpChannel, filePath);
                if (!fileHandle_)
                    return std::min(::libssh2_session_last_errno(sd.sshSession), LIBSSH2_ERROR_SOCKET_NONE);
                return LIBSSH2_ERROR_NONE;
            });
        }
        catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(displayPath_)), e.toString()); }

        if (startOffset > 0)
            ::libssh2_sftp_seek64(fileHandle_, startOffset); //client side only: next read request starts here
    }

    ~InputStreamSftp() { closeHandle(*session_, fileHandle_, displayPath_); }

    size_t tryRead(void* buffer, size_t bytesToRead) override //throw FileError, ThreadStopRequest
    {
        //libssh2_sftp_read has same semantics as Posix read:
        if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
            throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

        ssize_t bytesRead = 0;
        try
        {
            session_->executeBlocking("libssh2_sftp_read", //throw SysError, SysErrorSftpProtocol, ThreadStopRequest
                                      [&](const SshSession::Details& sd) //noexcept!
            {
                bytesRead = ::libssh2_sftp_read(fileHandle_, static_cast<char*>(buffer), bytesToRead);
                return static_cast<int>(bytesRead);
            });

            ASSERT_SYSERROR(static_cast<size_t>(bytesRead) <= bytesToRead);
        }
        catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(displayPath_)), e.toString()); }

        return bytesRead; //"zero indicates end of file"
    }

private:
    const std::wstring displayPath_;
    SftpSessionPool::SessionPtr session_;
    LIBSSH2_SFTP_HANDLE* fileHandle_ = nullptr;
};

//===========================================================================================================================

class SftpFileSystem : public RemoteFileSystem
{
public:
    explicit SftpFileSystem(const SftpLogin& login) : pool_(login) {}

    std::wstring getDisplayPath(const Zstring& itemPath) const override { return getSftpDisplayPath(pool_.getLogin(), itemPath); }

    std::vector<Item> getFolderContent(const Zstring& folderPath) override //throw FileError, ThreadStopRequest
    {
        const std::wstring errorMsg = replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(getDisplayPath(folderPath)));
        try
        {
            SftpSessionPool::SessionPtr session = pool_.getSession(); //throw SysError

            LIBSSH2_SFTP_HANDLE* dirHandle = nullptr;
            session->executeBlocking("libssh2_sftp_opendir", //throw SysError, SysErrorSftpProtocol, ThreadStopRequest
                                     [&](const SshSession::Details& sd) //noexcept!
            {
                dirHandle = sftpOpenFolder(sd.sftpChannel, folderPath);
                if (!dirHandle)
                    return std::min(::libssh2_session_last_errno(sd.sshSession), LIBSSH2_ERROR_SOCKET_NONE);
                return LIBSSH2_ERROR_NONE;
            });
            SFM_ON_SCOPE_EXIT(closeHandle(*session, dirHandle, getDisplayPath(folderPath)));

            std::vector<Item> output;
            std::vector<char> buf(1002); //libssh2 sftp.c: "handle->u.dir.names_left > 0" => item names are at most 256 bytes on common file systems
            for (;;)
            {
                LIBSSH2_SFTP_ATTRIBUTES attribs = {};
                int rc = 0;
                session->executeBlocking("libssh2_sftp_readdir", //throw SysError, SysErrorSftpProtocol, ThreadStopRequest
                [&](const SshSession::Details& sd) { return rc = ::libssh2_sftp_readdir(dirHandle, buf.data(), buf.size(), &attribs); }); //noexcept!

                if (rc == 0) //no more items
                    return output;

                const std::string_view itemName(buf.data(), rc);

                if (itemName == "." || itemName == "..") //check needed for SFTP, too!
                    continue;

                if ((attribs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) == 0) //server probably does not support these attributes => fail at folder level
                    throw SysError(replaceCpy(_("Cannot read file attributes of %x."), L"%x",
                                              fmtPath(getDisplayPath(appendPath(folderPath, Zstring(itemName))))) + L' ' + L"File attributes not available.");

                if (LIBSSH2_SFTP_S_ISDIR(attribs.permissions))
                    output.push_back({Zstring(itemName), ItemType::folder, 0});
                else if (LIBSSH2_SFTP_S_ISREG(attribs.permissions))
                {
                    if ((attribs.flags & LIBSSH2_SFTP_ATTR_SIZE) == 0)
                        throw SysError(replaceCpy(_("Cannot read file attributes of %x."), L"%x",
                                                  fmtPath(getDisplayPath(appendPath(folderPath, Zstring(itemName))))) + L' ' + L"File size not supported.");
                    output.push_back({Zstring(itemName), ItemType::file, attribs.filesize});
                }
                else //symlink, named pipe, device, socket
                    output.push_back({Zstring(itemName), ItemType::other, 0});
            }
        }
        catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
    }

    uint64_t getFileSize(const Zstring& filePath) override //throw FileError, ThreadStopRequest
    {
        try
        {
            SftpSessionPool::SessionPtr session = pool_.getSession(); //throw SysError

            LIBSSH2_SFTP_ATTRIBUTES attribs = {};
            session->executeBlocking("libssh2_sftp_stat", //throw SysError, SysErrorSftpProtocol, ThreadStopRequest
            [&](const SshSession::Details& sd) { return sftpStat(sd.sftpChannel, filePath, attribs); }); //noexcept!

            if ((attribs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) && LIBSSH2_SFTP_S_ISDIR(attribs.permissions))
                throw SysError(replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(filePath))));

            if ((attribs.flags & LIBSSH2_SFTP_ATTR_SIZE) == 0)
                throw SysError(L"File size not supported.");

            return attribs.filesize;
        }
        catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getDisplayPath(filePath))), e.toString()); }
    }

    std::unique_ptr<InputStream> getInputStream(const Zstring& filePath, uint64_t startOffset) override //throw FileError, ThreadStopRequest
    {
        return std::make_unique<InputStreamSftp>(pool_, filePath, startOffset); //throw FileError, ThreadStopRequest
    }

    void abortPendingIo() override { pool_.abortPendingIo(); } //noexcept

private:
    SftpSessionPool pool_;
};
}


std::unique_ptr<RemoteFileSystem> mirror::createSftpFileSystem(const SftpLogin& login)
{
    return std::make_unique<SftpFileSystem>(login);
}
