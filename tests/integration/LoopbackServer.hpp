#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <openssl/ssl.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <csignal>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace wapi::test {

/// One request as seen by LoopbackServer.
/// Class abbreviation: rr
struct RecordedRequest {
  std::string sMethod;
  std::string sTarget;                          // path and query as sent
  std::map<std::string, std::string> mHeaders;  // lower-cased names
  std::string sBody;
  std::string sServerName;                      // TLS SNI, empty if none was sent
  int iTlsVersion = 0;                          // SSL_version(), 0 for plain HTTP

  std::string header(const std::string& sName) const {
    auto it = mHeaders.find(sName);
    return it == mHeaders.end() ? std::string{} : it->second;
  }
};

/// Single-threaded HTTP/1.1 server on 127.0.0.1 with scripted replies.
/// Serves one request per connection. With an SSL_CTX it speaks TLS.
/// Class abbreviation: ls
class LoopbackServer {
 public:
  explicit LoopbackServer(SSL_CTX* pTlsCtx = nullptr) : _pTlsCtx(pTlsCtx) {
    // The client may close before SSL_shutdown writes close_notify.
    std::signal(SIGPIPE, SIG_IGN);
    _iListenFd = socket(AF_INET, SOCK_STREAM, 0);
    if (_iListenFd < 0) {
      throw std::runtime_error("Failed to create socket");
    }
    int iOpt = 1;
    setsockopt(_iListenFd, SOL_SOCKET, SO_REUSEADDR, &iOpt, sizeof(iOpt));

    sockaddr_in saAddr{};
    saAddr.sin_family = AF_INET;
    saAddr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    saAddr.sin_port = 0;
    if (bind(_iListenFd, reinterpret_cast<sockaddr*>(&saAddr), sizeof(saAddr)) < 0 ||
        listen(_iListenFd, 8) < 0) {
      close(_iListenFd);
      throw std::runtime_error("Failed to listen on 127.0.0.1");
    }
    socklen_t nLen = sizeof(saAddr);
    getsockname(_iListenFd, reinterpret_cast<sockaddr*>(&saAddr), &nLen);
    _uPort = ntohs(saAddr.sin_port);

    _thServer = std::thread([this]() { serve(); });
  }

  ~LoopbackServer() {
    _bStop = true;
    _thServer.join();
    close(_iListenFd);
  }

  LoopbackServer(const LoopbackServer&) = delete;
  LoopbackServer& operator=(const LoopbackServer&) = delete;

  uint16_t port() const { return _uPort; }

  /// Queue a reply for the next request.
  void replyWith(int iStatus, const std::string& sReason, const std::string& sBody,
                 const std::string& sContentType = "application/json") {
    std::lock_guard<std::mutex> lock(_mtx);
    _dqReplies.push_back({iStatus, sReason, sBody, sContentType});
  }

  /// Read requests but never answer them.
  void stayQuiet() { _bQuiet = true; }

  std::vector<RecordedRequest> requests() const {
    std::lock_guard<std::mutex> lock(_mtx);
    return _vRequests;
  }

 private:
  struct Reply {
    int iStatus;
    std::string sReason;
    std::string sBody;
    std::string sContentType;
  };

  /// Plain socket or TLS session over an accepted connection.
  class Connection {
   public:
    Connection(int iFd, SSL_CTX* pTlsCtx) : _iFd(iFd) {
      if (pTlsCtx) {
        _pSsl = SSL_new(pTlsCtx);
        SSL_set_fd(_pSsl, _iFd);
        _bReady = SSL_accept(_pSsl) == 1;
      }
    }
    ~Connection() {
      if (_pSsl) {
        if (_bReady) {
          SSL_shutdown(_pSsl);
        }
        SSL_free(_pSsl);
      }
      close(_iFd);
    }

    bool ready() const { return _bReady; }
    SSL* ssl() const { return _pSsl; }

    int read(char* pBuf, int iLen) {
      return _pSsl ? SSL_read(_pSsl, pBuf, iLen)
                   : static_cast<int>(::recv(_iFd, pBuf, static_cast<size_t>(iLen), 0));
    }

    void write(const std::string& sData) {
      size_t nOff = 0;
      while (nOff < sData.size()) {
        const int iLen = static_cast<int>(sData.size() - nOff);
        const int iSent = _pSsl ? SSL_write(_pSsl, sData.data() + nOff, iLen)
                                : static_cast<int>(::send(_iFd, sData.data() + nOff,
                                                          static_cast<size_t>(iLen), MSG_NOSIGNAL));
        if (iSent <= 0) {
          return;
        }
        nOff += static_cast<size_t>(iSent);
      }
    }

   private:
    int _iFd;
    SSL* _pSsl = nullptr;
    bool _bReady = true;
  };

  void serve() {
    while (!_bStop) {
      pollfd pfd{_iListenFd, POLLIN, 0};
      if (poll(&pfd, 1, 50) <= 0) {
        continue;
      }
      const int iFd = accept(_iListenFd, nullptr, nullptr);
      if (iFd < 0) {
        continue;
      }
      Connection conn(iFd, _pTlsCtx);
      if (!conn.ready()) {
        continue;
      }
      handle(conn);
    }
  }

  void handle(Connection& conn) {
    std::string sData;
    char vBuf[4096];
    size_t nHeadEnd = std::string::npos;
    while ((nHeadEnd = sData.find("\r\n\r\n")) == std::string::npos) {
      const int iRead = conn.read(vBuf, sizeof(vBuf));
      if (iRead <= 0) {
        return;
      }
      sData.append(vBuf, static_cast<size_t>(iRead));
    }

    RecordedRequest rr = parseHead(sData.substr(0, nHeadEnd));
    const std::string sLength = rr.header("content-length");
    const size_t nLength = sLength.empty() ? 0 : std::stoul(sLength);
    rr.sBody = sData.substr(nHeadEnd + 4);
    while (rr.sBody.size() < nLength) {
      const int iRead = conn.read(vBuf, sizeof(vBuf));
      if (iRead <= 0) {
        break;
      }
      rr.sBody.append(vBuf, static_cast<size_t>(iRead));
    }
    if (conn.ssl()) {
      const char* pName = SSL_get_servername(conn.ssl(), TLSEXT_NAMETYPE_host_name);
      rr.sServerName = pName ? pName : "";
      rr.iTlsVersion = SSL_version(conn.ssl());
    }

    Reply rpl{200, "OK", R"({"result":[]})", "application/json"};
    {
      std::lock_guard<std::mutex> lock(_mtx);
      _vRequests.push_back(rr);
      if (!_dqReplies.empty()) {
        rpl = _dqReplies.front();
        _dqReplies.pop_front();
      }
    }

    if (_bQuiet) {
      while (!_bStop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
      }
      return;
    }

    conn.write("HTTP/1.1 " + std::to_string(rpl.iStatus) + " " + rpl.sReason + "\r\n" +
               "Content-Type: " + rpl.sContentType + "\r\n" +
               "Content-Length: " + std::to_string(rpl.sBody.size()) + "\r\n" +
               "Connection: close\r\n\r\n" + rpl.sBody);
  }

  static RecordedRequest parseHead(const std::string& sHead) {
    RecordedRequest rr;
    size_t nLineStart = 0;
    bool bFirst = true;
    while (nLineStart <= sHead.size()) {
      size_t nLineEnd = sHead.find("\r\n", nLineStart);
      if (nLineEnd == std::string::npos) {
        nLineEnd = sHead.size();
      }
      const std::string sLine = sHead.substr(nLineStart, nLineEnd - nLineStart);
      if (bFirst) {
        const size_t nSp1 = sLine.find(' ');
        const size_t nSp2 = sLine.find(' ', nSp1 + 1);
        rr.sMethod = sLine.substr(0, nSp1);
        rr.sTarget = sLine.substr(nSp1 + 1, nSp2 - nSp1 - 1);
        bFirst = false;
      } else if (const size_t nColon = sLine.find(':'); nColon != std::string::npos) {
        std::string sName = sLine.substr(0, nColon);
        std::transform(sName.begin(), sName.end(), sName.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        size_t nValue = nColon + 1;
        while (nValue < sLine.size() && sLine[nValue] == ' ') {
          ++nValue;
        }
        rr.mHeaders[sName] = sLine.substr(nValue);
      }
      nLineStart = nLineEnd + 2;
    }
    return rr;
  }

  SSL_CTX* _pTlsCtx;
  int _iListenFd = -1;
  uint16_t _uPort = 0;
  std::atomic<bool> _bStop{false};
  std::atomic<bool> _bQuiet{false};
  std::thread _thServer;

  mutable std::mutex _mtx;
  std::deque<Reply> _dqReplies;
  std::vector<RecordedRequest> _vRequests;
};

}  // namespace wapi::test
