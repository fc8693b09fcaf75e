#include "sqlrag/vector/vector_backend.h"

#ifdef SQLRAG_HAVE_FAISS
#include "sqlrag/vector/faiss_search_backend.h"
#endif

namespace sqlrag::vector {

namespace {

#ifdef SQLRAG_HAVE_FAISS
constexpr bool kFaissCompiledIn = true;
#else
constexpr bool kFaissCompiledIn = false;
#endif

}  // namespace

bool backend_available(VectorBackend backend) {
  switch (backend) {
    case VectorBackend::kFlat:
      return true;
    case VectorBackend::kFaiss:
      return kFaissCompiledIn;
  }
  return false;
}

BackendProbe probe_backend(VectorBackend requested) {
  BackendProbe probe{.requested = requested, .selected = requested};
  if (!backend_available(requested)) {
    probe.selected = VectorBackend::kFlat;
  }
  return probe;
}

std::unique_ptr<ISearchBackend> make_search_backend(VectorBackend selected,
                                                    std::size_t dimension) {
#ifdef SQLRAG_HAVE_FAISS
  if (selected == VectorBackend::kFaiss) {
    return std::make_unique<FaissSearchBackend>(dimension);
  }
#endif
  (void)selected;
  return std::make_unique<FlatSearchBackend>(dimension);
}

}  // namespace sqlrag::vector
