#pragma once

#include <string>
#include <curl/curl.h>

namespace v3lp
{

    // HTTP response
    struct HttpResponse
    {
        long status_code;
        std::string body;
        std::string error;
        double elapsed_ms;

        bool ok() const { return status_code >= 200 && status_code < 300; }
    };

    // Blocking HTTP client over a single reusable libcurl easy handle
    class HttpClient
    {
    public:
        HttpClient();
        ~HttpClient();

        // Disable copy
        HttpClient(const HttpClient &) = delete;
        HttpClient &operator=(const HttpClient &) = delete;

        // Enable move
        HttpClient(HttpClient &&other) noexcept;
        HttpClient &operator=(HttpClient &&other) noexcept;

        // Configuration
        void set_timeout_ms(long timeout_ms);
        void add_header(const std::string &header);
        void set_user_agent(const std::string &user_agent);

        // HTTP methods
        HttpResponse get(const std::string &url);
        HttpResponse post(const std::string &url, const std::string &body);

    private:
        CURL *curl_;
        struct curl_slist *headers_;
        std::string user_agent_;
        long timeout_ms_;

        void init();
        void cleanup();
        HttpResponse perform(const std::string &url);
        void apply_common_options(CURL *handle);

        static size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata);
    };

    // Global initialization (call once at startup)
    void http_global_init();
    void http_global_cleanup();

} // namespace v3lp
