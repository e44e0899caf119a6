// main.cpp — Command-line wrapper around the fusion engine.
//
// Responsibilities:
// - Parse minimal flags (in/out, epsilon, bin-size, no-fuse, verbose).
// - Load a multi-object OBJ, run vertex_fusion, build the fused mesh and save it as OBJ.
// - Print a short summary to stdout so the Python adapter can parse it.

#include "fused_mesh.hpp"
#include "fusion.hpp"
#include "io_obj.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

static void usage(){
    fprintf(stderr, "gmdfuse (v%s)\n", GMDFUSE_VERSION);
    fprintf(stderr, "Usage: gmdfuse --in in.obj --out out.obj [--epsilon e] [--bin-size s] [--no-fuse] [--verbose]\n");
}

// Strict float parse: the whole argument must be a finite, non-negative number.
static bool parse_float(const char* s, float& out){
    errno = 0;
    char* end = nullptr;
    const float v = std::strtof(s, &end);
    if(errno != 0 || end == s || *end != '\0' || !(v >= 0.0f) || v > 1e30f) return false;
    out = v;
    return true;
}

int main(int argc, char** argv){
    const char* in_path=nullptr; const char* out_path=nullptr;
    FusionOptions opt;
    for(int i=1;i<argc;i++){
        if(!strcmp(argv[i],"--in") && i+1<argc) in_path=argv[++i];
        else if(!strcmp(argv[i],"--out") && i+1<argc) out_path=argv[++i];
        else if(!strcmp(argv[i],"--epsilon") && i+1<argc){
            if(!parse_float(argv[++i], opt.epsilon)){ fprintf(stderr, "Bad --epsilon: %s\n", argv[i]); usage(); return 2; }
        }
        else if(!strcmp(argv[i],"--bin-size") && i+1<argc){
            if(!parse_float(argv[++i], opt.bin_size)){ fprintf(stderr, "Bad --bin-size: %s\n", argv[i]); usage(); return 2; }
        }
        else if(!strcmp(argv[i],"--no-fuse")) opt.fuse=false;
        else if(!strcmp(argv[i],"--verbose")) opt.verbose=true;
        else { fprintf(stderr, "Unknown or incomplete option: %s\n", argv[i]); usage(); return 2; }
    }
    if(!in_path || !out_path){ usage(); return 2; }

    std::vector<VertexBuffer> vbufs; std::vector<IndexBuffer> ibufs; std::string err;
    if(!load_obj_buffers(in_path, vbufs, ibufs, err)){ fprintf(stderr, "Load error: %s\n", err.c_str()); return 3; }

    FusionIndex fusion; FusionReport rep;
    if(!vertex_fusion(ibufs, vbufs, opt, fusion, rep, err)){ fprintf(stderr, "Fusion failed: %s\n", err.c_str()); return 4; }

    FusedMesh mesh;
    if(!build_fused_mesh(ibufs, vbufs, fusion, mesh, err)){ fprintf(stderr, "Fusion failed: %s\n", err.c_str()); return 4; }

    if(!save_obj_fused(out_path, mesh, err)){ fprintf(stderr, "Save error: %s\n", err.c_str()); return 5; }

    // The two-line summary is parsed by the Python adapter; avoid extra stdout noise here.
    fprintf(stdout, "verts: %zu -> %zu\nrounds: %zu collisions: %zu unresolved: %zu\n",
            rep.verts_before, rep.verts_after, rep.rounds, rep.collisions_resolved, rep.unresolved_collisions);
    return 0;
}
