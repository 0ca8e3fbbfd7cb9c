#pragma once

#include "infra/exception.h"
#include "infra/filesystem.h"
#include "infra/log.h"
#include "infra/string.h"

#include <utility>
#include <xlsxwriter.h>

namespace cbudget::xl {

// Owns a libxlsxwriter workbook, the document is written to disk when it is closed
class WorkBook
{
public:
    explicit WorkBook(const fs::path& path)
    : _wb(workbook_new(inf::str::from_u8(path.u8string()).c_str()))
    {
        if (!_wb) {
            throw inf::RuntimeError("Failed to create excel document: {}", path);
        }
    }

    WorkBook(const WorkBook&) = delete;
    WorkBook& operator=(const WorkBook&) = delete;

    ~WorkBook() noexcept
    {
        if (_wb) {
            if (auto err = workbook_close(_wb); err != LXW_NO_ERROR) {
                inf::Log::error("Failed to write excel document: {}", lxw_strerror(err));
            }
        }
    }

    void close()
    {
        if (auto err = workbook_close(std::exchange(_wb, nullptr)); err != LXW_NO_ERROR) {
            throw inf::RuntimeError("Failed to write excel document: {}", lxw_strerror(err));
        }
    }

    operator lxw_workbook*() noexcept
    {
        return _wb;
    }

private:
    lxw_workbook* _wb = nullptr;
};

}
