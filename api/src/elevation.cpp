#include "elevation_utils.hpp"

#include <iomanip>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;


namespace {

std::once_flag g_oCurlInitFlag;

size_t appendResponseData(void* pContents, size_t nSize, size_t nMemb, std::string* psBuffer) {
    const size_t nTotalSize = nSize * nMemb;
    psBuffer->append(static_cast<char*>(pContents), nTotalSize);
    return nTotalSize;
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

} // namespace

double parseElevationResponse(const std::string& sResponseBody) {
    try {
        const json oResponse = json::parse(sResponseBody);
        if(!oResponse.is_object())
            throw ProviderError("unexpected response layout");
        const std::string sStatus = oResponse.value("status", std::string());
        if(sStatus != "OK") {
            const std::string sMessage = oResponse.value("error_message", std::string());
            throw ProviderError("api error: " + sStatus + ", message: " + sMessage);
        }
        const auto iResults = oResponse.find("results");
        if(iResults == oResponse.end() || !iResults->is_array() || iResults->empty())
            throw ProviderError("no elevation results");
        return iResults->front().at("elevation").get<double>();
    }
    catch(const json::exception& oError) {
        throw ProviderError(std::string("invalid response: ") + oError.what());
    }
}

GoogleElevationProvider::GoogleElevationProvider(std::string sApiKey, std::string sApiUrl, long nTimeoutSec):
        m_sApiKey(std::move(sApiKey)),
        m_sApiUrl(std::move(sApiUrl)),
        m_nTimeoutSec(nTimeoutSec > 0 ? nTimeoutSec : DEFAULT_ELEVATION_TIMEOUT_SEC) {
    std::call_once(g_oCurlInitFlag, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

std::string GoogleElevationProvider::buildRequestUrl(double dLatitude, double dLongitude) const {
    std::stringstream ssUrl;
    ssUrl << m_sApiUrl << "?locations=" << std::fixed << std::setprecision(6)
          << dLatitude << "," << dLongitude << "&key=";
    CurlHandle pCurl(curl_easy_init(), &curl_easy_cleanup);
    char* acEscapedKey = pCurl ? curl_easy_escape(pCurl.get(), m_sApiKey.c_str(), (int)m_sApiKey.size()) : nullptr;
    if(acEscapedKey == nullptr)
        throw ProviderError("failed to escape the api key");
    ssUrl << acEscapedKey;
    curl_free(acEscapedKey);
    return ssUrl.str();
}

double GoogleElevationProvider::fetchElevation(double dLatitude, double dLongitude) {
    if(m_sApiKey.empty())
        throw ProviderError("GOOGLE_API_KEY is not set");
    CurlHandle pCurl(curl_easy_init(), &curl_easy_cleanup);
    if(!pCurl)
        throw ProviderError("failed to initialize CURL");
    const std::string sUrl = buildRequestUrl(dLatitude, dLongitude);
    std::string sResponseBody;
    curl_easy_setopt(pCurl.get(), CURLOPT_URL, sUrl.c_str());
    curl_easy_setopt(pCurl.get(), CURLOPT_WRITEFUNCTION, appendResponseData);
    curl_easy_setopt(pCurl.get(), CURLOPT_WRITEDATA, &sResponseBody);
    curl_easy_setopt(pCurl.get(), CURLOPT_TIMEOUT, m_nTimeoutSec);
    curl_easy_setopt(pCurl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(pCurl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    const CURLcode eResult = curl_easy_perform(pCurl.get());
    if(eResult != CURLE_OK)
        throw ProviderError(std::string("request failed: ") + curl_easy_strerror(eResult));
    long nHttpCode = 0;
    curl_easy_getinfo(pCurl.get(), CURLINFO_RESPONSE_CODE, &nHttpCode);
    if(nHttpCode != 200)
        throw ProviderError("request failed with HTTP status " + std::to_string(nHttpCode));
    return parseElevationResponse(sResponseBody);
}
