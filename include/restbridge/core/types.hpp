#pragma once
#include <any>
#include <map>
#include <vector>
#include <string>
#include <utility>
#include <functional>

namespace restbridge {

    class Arguments; // Forward-declaration

    /**
     * A decoded procedure value. An empty std::any stands for null.
     *
     * Concrete payloads produced by the codec: bool, std::int64_t, double, std::string,
     * ValueList, ValueMap and Record.
     */
    using Value = std::any;
    using ValueList = std::vector<Value>;
    using ValueMap = std::map<std::string, Value>;

    /**
     * @struct Record
     * @brief A named record value; also the shape of declared procedure errors.
     *
     * `tag` is set for union variants (e.g. the variants of an error union) and left
     * empty for plain records.
     */
    struct Record {
        std::string typeName;
        std::string tag;
        ValueMap    fields;
    };

    using Header = std::pair<std::string, std::string>;
    using HeaderList = std::vector<Header>;

    using ProcedureHandler = std::function<Value(const Arguments&)>;

}
