#include "http_client.hpp"
#include <chrono>
#include <stdexcept>
#include <utility>

namespace v3lp
{

    // Global initialization
    static bool g_curl_initialized = false;

    void http_global_init()
    {
        if (!g_curl_initialized)
        {
            curl_global_init(CURL_GLOBAL_ALL);
            g_curl_initialized = true;
        }
    }

    void http_global_cleanup()
    {
        if (g_curl_initialized)
        {
            curl_global_cleanup();
            g_curl_initialized = false;
        }
    }

    HttpClient::HttpClient()
        : curl_(nullptr), headers_(nullptr), timeout_ms_(10000)
    {
        init();
    }

    HttpClient::~HttpClient()
    {
        cleanup();
    }

    HttpClient::HttpClient(HttpClient &&other) noexcept
        : curl_(other.curl_), headers_(other.headers_),
          user_agent_(std::move(other.user_agent_)),
          timeout_ms_(other.timeout_ms_)
    {
        other.curl_ = nullptr;
        other.headers_ = nullptr;
    }

    HttpClient &HttpClient::operator=(HttpClient &&other) noexcept
    {
        if (this != &other)
        {
            cleanup();
            curl_ = other.curl_;
            headers_ = other.headers_;
            user_agent_ = std::move(other.user_agent_);
            timeout_ms_ = other.timeout_ms_;
            other.curl_ = nullptr;
            other.headers_ = nullptr;
        }
        return *this;
    }

    void HttpClient::init()
    {
        curl_ = curl_easy_init();
        if (!curl_)
        {
            throw std::runtime_error("Failed to initialize CURL");
        }

        apply_common_options(curl_);

        // Default headers
        add_header("Connection: keep-alive");
        add_header("Accept: application/json");
        add_header("Content-Type: application/json");
    }

    void HttpClient::cleanup()
    {
        if (headers_)
        {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        if (curl_)
        {
            curl_easy_cleanup(curl_);
            curl_ = nullptr;
        }
    }

    void HttpClient::set_timeout_ms(long timeout_ms)
    {
        timeout_ms_ = timeout_ms;
    }

    void HttpClient::add_header(const std::string &header)
    {
        headers_ = curl_slist_append(headers_, header.c_str());
    }

    void HttpClient::set_user_agent(const std::string &user_agent)
    {
        user_agent_ = user_agent;
        if (curl_)
        {
            curl_easy_setopt(curl_, CURLOPT_USERAGENT, user_agent.c_str());
        }
    }

    void HttpClient::apply_common_options(CURL *handle)
    {
        curl_easy_setopt(handle, CURLOPT_TCP_NODELAY, 1L);
        curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 3L);
        curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);

        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L);

        if (!user_agent_.empty())
        {
            curl_easy_setopt(handle, CURLOPT_USERAGENT, user_agent_.c_str());
        }
    }

    size_t HttpClient::write_callback(char *ptr, size_t size, size_t nmemb, void *userdata)
    {
        auto *response = static_cast<std::string *>(userdata);
        size_t total_size = size * nmemb;
        response->append(ptr, total_size);
        return total_size;
    }

    HttpResponse HttpClient::perform(const std::string &url)
    {
        HttpResponse response;
        response.status_code = 0;

        auto start = std::chrono::high_resolution_clock::now();

        curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms_);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);

        CURLcode res = curl_easy_perform(curl_);

        auto end = std::chrono::high_resolution_clock::now();
        response.elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();

        if (res != CURLE_OK)
        {
            response.error = curl_easy_strerror(res);
            return response;
        }

        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &response.status_code);
        return response;
    }

    HttpResponse HttpClient::get(const std::string &url)
    {
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl_, CURLOPT_POST, 0L);

        return perform(url);
    }

    HttpResponse HttpClient::post(const std::string &url, const std::string &body)
    {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

        return perform(url);
    }

} // namespace v3lp
