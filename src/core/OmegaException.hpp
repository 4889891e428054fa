//
// Created by Malik T on 13/08/2025.
//

#ifndef CONQUESTGAME_OMEGAEXCEPTION_HPP
#define CONQUESTGAME_OMEGAEXCEPTION_HPP
#include <source_location>
#include <string>
#include <utility>

namespace conquest::core
{
    //inspired by CPPCon2023 "Exceptionally bad" by Peter Muldoon
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
            src_loc_{src_loc}
        {
        }

        [[nodiscard]]
        auto what() -> std::string& { return err_str_; }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        auto data() -> T& { return usr_data_; }
        auto data() const noexcept -> T const& { return usr_data_; }

        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = "Failed to process with code (";
            s += std::to_string(static_cast<int>(usr_data_));
            s += "): ";
            s += err_str_;
            s += "\n";
            s += src_loc_.file_name();
            s += "(" + std::to_string(src_loc_.line()) + ":" + std::to_string(src_loc_.column()) + "), function `";
            s += src_loc_.function_name();
            s += "`\n";
            return s;
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location const src_loc_;
    };
}

#endif //CONQUESTGAME_OMEGAEXCEPTION_HPP
