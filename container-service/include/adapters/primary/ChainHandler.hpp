// adapters/primary/ChainHandler.hpp
#pragma once
#include <IHttpHandler.hpp>
#include <memory>
#include <vector>
#include <iostream>
#include <nlohmann/json.hpp>

namespace serverlib
{

    /**
     * @brief Цепочка handler'ов: middleware сбрасывает статус в 0, чтобы цепочка продолжилась
     *
     * Первый handler, выставивший ненулевой статус, завершает цепочку.
     */
    class ChainHandler : public IHttpHandler
    {
    public:
        template <typename... Handlers>
        explicit ChainHandler(Handlers &&...handlers)
        {
            (handlers_.push_back(std::forward<Handlers>(handlers)), ...);
        }

        void handle(IRequest &req, IResponse &res) override
        {
            for (auto &h : handlers_)
            {
                h->handle(req, res);
                if (res.getStatus() != 0)
                    return;
            }

            // все звенья отработали как middleware: ответ так никто и не сформировал
            std::cerr << "[ChainHandler] Error: chain finished for " << req.getMethod() << " "
                      << req.getPath() << " with zero httpStatus." << std::endl;
            nlohmann::json error;
            error["error"] = "Internal server error";
            res.setResult(500, "application/json", error.dump());
        }

    private:
        std::vector<std::shared_ptr<IHttpHandler>> handlers_;
    };

} // namespace serverlib
