// Structural equality over syntax trees.
#include "backport/ast.hpp"

namespace backport
{

    static bool equal_impl(const node_ptr &a, const node_ptr &b, bool ignore_positions);

    static bool value_equal(const field_value &x, const field_value &y, bool ignore_positions)
    {
        if (x.index() != y.index())
            return false;
        if (auto *p = std::get_if<node_ptr>(&x))
            return equal_impl(*p, std::get<node_ptr>(y), ignore_positions);
        if (auto *l = std::get_if<node_list>(&x))
        {
            const auto &r = std::get<node_list>(y);
            if (l->size() != r.size())
                return false;
            for (size_t i = 0; i < l->size(); ++i)
                if (!equal_impl((*l)[i], r[i], ignore_positions))
                    return false;
            return true;
        }
        return x == y;
    }

    static bool equal_impl(const node_ptr &a, const node_ptr &b, bool ignore_positions)
    {
        if (a.get() == b.get())
            return true;
        if (!a || !b)
            return false;
        if (a->kind != b->kind)
            return false;
        if (!ignore_positions && (a->line != b->line || a->col != b->col))
            return false;
        if (a->fields.size() != b->fields.size())
            return false;
        auto it = b->fields.begin();
        for (const auto &kv : a->fields)
        {
            if (kv.first != it->first)
                return false;
            if (!value_equal(kv.second, it->second, ignore_positions))
                return false;
            ++it;
        }
        return true;
    }

    bool equal(const node_ptr &a, const node_ptr &b, bool ignore_positions)
    {
        return equal_impl(a, b, ignore_positions);
    }

} // namespace backport
