#include <download.hxx>
#include <http.hxx>

#include "test_util.hxx"

#include <atomic>
#include <map>
#include <sstream>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

class DownloadTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_Root = MakeSandbox(m_Sandbox);
        m_Bin = m_Root / "bin";
        m_Payload = m_Root / "releases" / "rzup";
        m_Output = m_Root / "out" / "rzup";

        fs::create_directories(m_Bin);
        fs::create_directories(m_Output.parent_path());
        WriteFile(m_Payload, "payload");
    }

    // a curl stand-in that copies file:// URLs and records its arguments
    void InstallFakeCurl(const std::string &extra = "")
    {
        WriteScript(m_Bin / "curl",
                    "echo \"$@\" > '" + (m_Root / "curl.args").string() + "'\n"
                    "out=''\nurl=''\n"
                    "while [ $# -gt 0 ]; do\n"
                    "  case \"$1\" in\n"
                    "    --output) out=\"$2\"; shift 2 ;;\n"
                    "    --*) shift ;;\n"
                    "    *) url=\"$1\"; shift ;;\n"
                    "  esac\n"
                    "done\n"
                    + extra +
                    "/bin/cp \"${url#file://}\" \"$out\"\n");
    }

    void InstallFakeWget()
    {
        WriteScript(m_Bin / "wget",
                    "echo \"$@\" > '" + (m_Root / "wget.args").string() + "'\n"
                    "out=''\nurl=''\n"
                    "for arg in \"$@\"; do\n"
                    "  case \"$arg\" in\n"
                    "    --output-document=*) out=\"${arg#--output-document=}\" ;;\n"
                    "    --*) ;;\n"
                    "    *) url=\"$arg\" ;;\n"
                    "  esac\n"
                    "done\n"
                    "/bin/cp \"${url#file://}\" \"$out\"\n");
    }

    std::string Url() const
    {
        return "file://" + m_Payload.string();
    }

    TempDirectory m_Sandbox;
    fs::path m_Root;
    fs::path m_Bin;
    fs::path m_Payload;
    fs::path m_Output;
};

TEST_F(DownloadTest, CheckFailsWithoutCurlOrWget)
{
    ScopedEnv path("PATH", m_Bin.string());

    testing::internal::CaptureStderr();
    DownloaderKind selected = DownloaderKind::Auto;
    EXPECT_NE(CheckDownloader(DownloaderKind::Auto, selected), 0);
    const auto output = testing::internal::GetCapturedStderr();

    EXPECT_EQ(output, "error: need 'curl' or 'wget' (neither found)\n");
}

TEST_F(DownloadTest, CheckPrefersCurl)
{
    InstallFakeCurl();
    InstallFakeWget();
    ScopedEnv path("PATH", m_Bin.string());

    DownloaderKind selected = DownloaderKind::Auto;
    ASSERT_EQ(CheckDownloader(DownloaderKind::Auto, selected), 0);
    EXPECT_EQ(selected, DownloaderKind::Curl);
}

TEST_F(DownloadTest, CheckFallsBackToWget)
{
    InstallFakeWget();
    ScopedEnv path("PATH", m_Bin.string());

    DownloaderKind selected = DownloaderKind::Auto;
    ASSERT_EQ(CheckDownloader(DownloaderKind::Auto, selected), 0);
    EXPECT_EQ(selected, DownloaderKind::Wget);
}

TEST_F(DownloadTest, CheckForcedToolMustExist)
{
    InstallFakeCurl();
    ScopedEnv path("PATH", m_Bin.string());

    testing::internal::CaptureStderr();
    DownloaderKind selected = DownloaderKind::Auto;
    EXPECT_NE(CheckDownloader(DownloaderKind::Wget, selected), 0);
    const auto output = testing::internal::GetCapturedStderr();
    EXPECT_EQ(output, "error: need 'wget' (command not found)\n");

    ASSERT_EQ(CheckDownloader(DownloaderKind::Native, selected), 0);
    EXPECT_EQ(selected, DownloaderKind::Native);
}

TEST_F(DownloadTest, CurlFetchesToDestination)
{
    InstallFakeCurl();
    ScopedEnv path("PATH", m_Bin.string());

    ASSERT_EQ(Download(DownloaderKind::Curl, Url(), m_Output), 0);

    EXPECT_EQ(ReadFile(m_Output), "payload");
    EXPECT_EQ(ReadFile(m_Root / "curl.args"),
              "--silent --show-error --fail --location " + Url() + " --output " + m_Output.string() + "\n");
}

TEST_F(DownloadTest, WgetFetchesToDestination)
{
    InstallFakeWget();
    ScopedEnv path("PATH", m_Bin.string());

    ASSERT_EQ(Download(DownloaderKind::Wget, Url(), m_Output), 0);

    EXPECT_EQ(ReadFile(m_Output), "payload");
    EXPECT_EQ(ReadFile(m_Root / "wget.args"), "--quiet --output-document=" + m_Output.string() + " " + Url() + "\n");
}

TEST_F(DownloadTest, DiagnosticOutputFailsEvenOnZeroExit)
{
    InstallFakeCurl("echo 'curl: (6) Could not resolve host: example.invalid' >&2\n");
    ScopedEnv path("PATH", m_Bin.string());

    testing::internal::CaptureStderr();
    EXPECT_NE(Download(DownloaderKind::Curl, Url(), m_Output), 0);
    const auto output = testing::internal::GetCapturedStderr();

    EXPECT_EQ(output, "error: curl: (6) Could not resolve host: example.invalid\n");
}

TEST_F(DownloadTest, SilentNonZeroExitFails)
{
    WriteScript(m_Bin / "curl", "exit 22\n");
    ScopedEnv path("PATH", m_Bin.string());

    testing::internal::CaptureStderr();
    EXPECT_NE(Download(DownloaderKind::Curl, Url(), m_Output), 0);
    const auto output = testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("error: command failed: curl --silent"), std::string::npos) << output;
}

TEST_F(DownloadTest, NativeRejectsUnsupportedUrl)
{
    testing::internal::CaptureStderr();
    EXPECT_NE(Download(DownloaderKind::Native, Url(), m_Output), 0);
    const auto output = testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("error: invalid download url"), std::string::npos) << output;
}

// Answers each connection on 127.0.0.1 with the canned response for its
// request path, then closes it.
class LoopbackServer
{
public:
    LoopbackServer()
    {
        m_Socket = socket(AF_INET, SOCK_STREAM, 0);
        EXPECT_GE(m_Socket, 0);

        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        address.sin_port = 0;

        EXPECT_EQ(bind(m_Socket, reinterpret_cast<sockaddr *>(&address), sizeof(address)), 0);
        EXPECT_EQ(listen(m_Socket, 16), 0);

        socklen_t length = sizeof(address);
        EXPECT_EQ(getsockname(m_Socket, reinterpret_cast<sockaddr *>(&address), &length), 0);
        m_Port = ntohs(address.sin_port);
    }

    ~LoopbackServer()
    {
        m_Stop = true;
        if (m_Thread.joinable())
        {
            // wake the blocking accept
            const auto wake = socket(AF_INET, SOCK_STREAM, 0);
            sockaddr_in address{};
            address.sin_family = AF_INET;
            address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            address.sin_port = htons(m_Port);
            connect(wake, reinterpret_cast<sockaddr *>(&address), sizeof(address));
            close(wake);

            m_Thread.join();
        }
        close(m_Socket);
    }

    LoopbackServer(const LoopbackServer &) = delete;
    LoopbackServer &operator=(const LoopbackServer &) = delete;

    void Route(const std::string &path, const std::string &response)
    {
        m_Routes[path] = response;
    }

    void Start()
    {
        m_Thread = std::thread([this] { Serve(); });
    }

    [[nodiscard]] std::string Url(const std::string &path) const
    {
        return "http://127.0.0.1:" + std::to_string(m_Port) + path;
    }

    [[nodiscard]] int Requests() const { return m_Requests; }

private:
    void Serve()
    {
        while (!m_Stop)
        {
            const auto client = accept(m_Socket, nullptr, nullptr);
            if (client < 0)
                continue;

            if (m_Stop)
            {
                close(client);
                break;
            }

            std::string request;
            char buf[1024];
            while (request.find("\r\n\r\n") == std::string::npos)
            {
                const auto len = recv(client, buf, sizeof(buf), 0);
                if (len <= 0)
                    break;
                request.append(buf, static_cast<std::size_t>(len));
            }

            ++m_Requests;

            // "GET <path> HTTP/1.1"
            const auto begin = request.find(' ') + 1;
            const auto path = request.substr(begin, request.find(' ', begin) - begin);

            const auto it = m_Routes.find(path);
            const auto response = it != m_Routes.end()
                                      ? it->second
                                      : "HTTP/1.1 404 Not Found\r\nContent-Length: 9\r\n\r\nnot found";

            send(client, response.data(), response.size(), 0);
            close(client);
        }
    }

    int m_Socket = -1;
    std::uint16_t m_Port{};
    std::map<std::string, std::string> m_Routes;
    std::thread m_Thread;
    std::atomic<bool> m_Stop{};
    std::atomic<int> m_Requests{};
};

static std::string redirect_to(const std::string &location)
{
    return "HTTP/1.1 302 Found\r\nLocation: " + location + "\r\nContent-Length: 0\r\n\r\n";
}

static std::string ok_with(const std::string &body)
{
    return "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

TEST_F(DownloadTest, NativeFollowsRelativeRedirect)
{
    LoopbackServer server;
    server.Route("/a/rzup", redirect_to("b/rzup"));
    server.Route("/a/b/rzup", ok_with("BINARY"));
    server.Start();

    ASSERT_EQ(Download(DownloaderKind::Native, server.Url("/a/rzup"), m_Output), 0);
    EXPECT_EQ(ReadFile(m_Output), "BINARY");
    EXPECT_EQ(server.Requests(), 2);
}

TEST_F(DownloadTest, NativeFollowsAbsoluteRedirect)
{
    LoopbackServer server;
    server.Route("/rzup", redirect_to(server.Url("/releases/v1/rzup")));
    server.Route("/releases/v1/rzup", ok_with("RELEASED"));
    server.Start();

    ASSERT_EQ(Download(DownloaderKind::Native, server.Url("/rzup"), m_Output), 0);
    EXPECT_EQ(ReadFile(m_Output), "RELEASED");
}

TEST_F(DownloadTest, NativeStopsRedirectLoop)
{
    LoopbackServer server;
    server.Route("/loop", redirect_to("/loop"));
    server.Start();

    testing::internal::CaptureStderr();
    EXPECT_NE(Download(DownloaderKind::Native, server.Url("/loop"), m_Output), 0);
    const auto output = testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("error: too many redirects.\n"), std::string::npos) << output;
    EXPECT_EQ(server.Requests(), http::MAX_REDIRECTS + 1);
}

TEST_F(DownloadTest, NativeFailsOnErrorStatus)
{
    LoopbackServer server;
    server.Start();

    const auto url = server.Url("/missing");

    testing::internal::CaptureStderr();
    EXPECT_NE(Download(DownloaderKind::Native, url, m_Output), 0);
    const auto output = testing::internal::GetCapturedStderr();

    EXPECT_EQ(output, "error: HTTP 404 Not Found: " + url + "\n");
    EXPECT_EQ(ReadFile(m_Output), "");
}

TEST(DownloaderKindTest, ParsesNames)
{
    DownloaderKind kind = DownloaderKind::Auto;

    ASSERT_EQ(ParseDownloaderKind("curl", kind), 0);
    EXPECT_EQ(kind, DownloaderKind::Curl);
    ASSERT_EQ(ParseDownloaderKind("WGET", kind), 0);
    EXPECT_EQ(kind, DownloaderKind::Wget);
    ASSERT_EQ(ParseDownloaderKind("native", kind), 0);
    EXPECT_EQ(kind, DownloaderKind::Native);
    ASSERT_EQ(ParseDownloaderKind("auto", kind), 0);
    EXPECT_EQ(kind, DownloaderKind::Auto);

    testing::internal::CaptureStderr();
    EXPECT_NE(ParseDownloaderKind("ftp", kind), 0);
    testing::internal::GetCapturedStderr();
}

TEST(DownloaderKindTest, Prints)
{
    std::ostringstream stream;
    stream << DownloaderKind::Curl << " " << DownloaderKind::Native;
    EXPECT_EQ(stream.str(), "curl native");
}
